// Regex railroad diagrams: parsed pattern JSON in, SVG out (C++20)
#include <diagram_render/renderer.hpp>
#include <regex_loaders/json_loader.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

#ifndef REGEX_RAILROAD_VERSION
#define REGEX_RAILROAD_VERSION "0.0.0"
#endif

namespace {

const char* const usage_text =
    "Usage: regex_railroad [options] [input.json]\n"
    "\n"
    "Reads a parsed pattern (JSON) from input.json or stdin and writes an SVG\n"
    "railroad diagram.\n"
    "\n"
    "Options:\n"
    "  -o <file>              output file (default regex.svg, '-' for stdout)\n"
    "  --config <file.json>   style and layout settings\n"
    "  --padding <n>          outer and box padding\n"
    "  --font-size <n>        font size (character width follows)\n"
    "  --line-width <n>       connector stroke width\n"
    "  --text-color <c>       text color\n"
    "  --line-color <c>       connector color\n"
    "  --literal-fill <c>     literal box fill\n"
    "  --charset-fill <c>     character class box fill\n"
    "  --escape-fill <c>      escape box fill\n"
    "  --anchor-fill <c>      anchor box fill\n"
    "  --subexp-fill <c>      outermost group fill\n"
    "  --log-file <file>      write log messages to a file\n"
    "  --verbose              debug logging\n"
    "  -v, --version          print version and exit\n"
    "  -h, --help             print this help and exit\n";

struct Options {
    std::string input;  // empty: stdin
    std::string output = "regex.svg";
    std::string config_path;
    std::string log_file;
    bool verbose = false;

    std::optional<double> padding;
    std::optional<double> font_size;
    std::optional<double> line_width;
    std::optional<std::string> text_color;
    std::optional<std::string> line_color;
    std::optional<std::string> literal_fill;
    std::optional<std::string> charset_fill;
    std::optional<std::string> escape_fill;
    std::optional<std::string> anchor_fill;
    std::optional<std::string> subexp_fill;
};

enum class ParseResult { Run, ExitOk, ExitError };

std::optional<double> parse_number(const std::string& text) {
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size()) return std::nullopt;
    return value;
}

ParseResult parse_args(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            std::fputs(usage_text, stdout);
            return ParseResult::ExitOk;
        }
        if (arg == "-v" || arg == "--version") {
            std::printf("regex_railroad %s\n", REGEX_RAILROAD_VERSION);
            return ParseResult::ExitOk;
        }
        if (arg == "--verbose") {
            opts.verbose = true;
            continue;
        }

        if (!arg.empty() && arg[0] == '-' && arg != "-") {
            if (i + 1 >= argc) {
                (void)fprintf(stderr, "option %s needs a value\n\n%s", arg.c_str(), usage_text);
                return ParseResult::ExitError;
            }
            const std::string value = argv[++i];

            std::optional<double>* number = nullptr;
            std::optional<std::string>* color = nullptr;
            if (arg == "-o") opts.output = value;
            else if (arg == "--config") opts.config_path = value;
            else if (arg == "--log-file") opts.log_file = value;
            else if (arg == "--padding") number = &opts.padding;
            else if (arg == "--font-size") number = &opts.font_size;
            else if (arg == "--line-width") number = &opts.line_width;
            else if (arg == "--text-color") color = &opts.text_color;
            else if (arg == "--line-color") color = &opts.line_color;
            else if (arg == "--literal-fill") color = &opts.literal_fill;
            else if (arg == "--charset-fill") color = &opts.charset_fill;
            else if (arg == "--escape-fill") color = &opts.escape_fill;
            else if (arg == "--anchor-fill") color = &opts.anchor_fill;
            else if (arg == "--subexp-fill") color = &opts.subexp_fill;
            else {
                (void)fprintf(stderr, "unknown option %s\n\n%s", arg.c_str(), usage_text);
                return ParseResult::ExitError;
            }

            if (number) {
                *number = parse_number(value);
                if (!*number) {
                    (void)fprintf(stderr, "option %s expects a number, got '%s'\n", arg.c_str(), value.c_str());
                    return ParseResult::ExitError;
                }
            }
            if (color) *color = value;
            continue;
        }

        if (!opts.input.empty()) {
            (void)fprintf(stderr, "only one input file may be given\n\n%s", usage_text);
            return ParseResult::ExitError;
        }
        opts.input = arg == "-" ? std::string() : arg;
    }
    return ParseResult::Run;
}

// stdout may carry the SVG, so console logging goes to stderr.
void setup_logging(const Options& opts) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("regex_railroad_console"));
    if (!opts.log_file.empty()) {
        try {
            auto logger = spdlog::basic_logger_mt("regex_railroad", opts.log_file, true);
            logger->flush_on(spdlog::level::info);
            spdlog::set_default_logger(logger);
        } catch (const spdlog::spdlog_ex& e) {
            (void)fprintf(stderr, "cannot open log file %s: %s\n", opts.log_file.c_str(), e.what());
        }
    }
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    spdlog::set_level(opts.verbose ? spdlog::level::debug : spdlog::level::info);
}

void apply_overrides(const Options& opts, diagram_render::Config& config) {
    if (opts.padding) config.padding = *opts.padding;
    if (opts.font_size) {
        config.font_size = *opts.font_size;
        config.char_width = *opts.font_size * 0.6;
    }
    if (opts.line_width) config.line_width = *opts.line_width;
    if (opts.text_color) config.text_color = *opts.text_color;
    if (opts.line_color) config.line_color = *opts.line_color;
    if (opts.literal_fill) config.literal_fill = *opts.literal_fill;
    if (opts.charset_fill) config.charset_fill = *opts.charset_fill;
    if (opts.escape_fill) config.escape_fill = *opts.escape_fill;
    if (opts.anchor_fill) config.anchor_fill = *opts.anchor_fill;
    if (opts.subexp_fill) config.subexp_fill = *opts.subexp_fill;
}

bool write_output(const std::string& path, const std::string& svg) {
    if (path == "-") {
        std::cout << svg << '\n';
        return static_cast<bool>(std::cout);
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) return false;
    out << svg << '\n';
    return static_cast<bool>(out);
}

} // namespace

int main(int argc, char* argv[])
{
    Options opts;
    switch (parse_args(argc, argv, opts)) {
    case ParseResult::ExitOk: return 0;
    case ParseResult::ExitError: return 1;
    case ParseResult::Run: break;
    }

    setup_logging(opts);

    diagram_render::Config config;
    if (!opts.config_path.empty()) {
        auto loaded = regex_loaders::load_config_from_json_file(opts.config_path, config);
        if (!loaded) return 1;
        config = std::move(*loaded);
    }
    apply_overrides(opts, config);

    std::optional<regex_loaders::RegexDocument> doc = opts.input.empty()
        ? regex_loaders::load_regex_document_from_json(std::cin)
        : regex_loaders::load_regex_document_from_json_file(opts.input);
    if (!doc) return 1;

    if (doc->error) {
        (void)fprintf(stderr, "%s\n", regex_loaders::format_parse_failure(*doc->error).c_str());
        return 1;
    }

    spdlog::debug("rendering {} pattern '{}'", doc->flavor.empty() ? "unnamed" : doc->flavor, doc->pattern);
    const std::string svg = diagram_render::render(*doc->ast, config);

    if (!write_output(opts.output, svg)) {
        spdlog::error("cannot write '{}'", opts.output);
        return 1;
    }
    if (opts.output != "-")
        spdlog::info("Wrote {}", opts.output);
    return 0;
}
