#include <regex_loaders/parse_failure.hpp>

namespace regex_loaders {

std::string format_parse_failure(const ParseFailure& failure) {
    std::string out = "Error parsing pattern:\n\n  ";
    out += failure.pattern;
    out += '\n';

    const auto length = static_cast<int>(failure.pattern.size());
    if (failure.column >= 1 && failure.column <= length) {
        out += "  ";
        out.append(static_cast<std::size_t>(failure.column - 1), ' ');
        out += "^\n";
    }

    out += '\n';
    out += failure.message;
    return out;
}

} // namespace regex_loaders
