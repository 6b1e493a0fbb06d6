#include <regex_loaders/json_loader.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <memory>
#include <type_traits>
#include <utility>

namespace regex_loaders {

namespace {

using nlohmann::json;
using namespace regex_model;

std::string string_field(const json& j, const char* key) {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : "";
}

int int_field(const json& j, const char* key, int fallback) {
    return j.contains(key) && j[key].is_number_integer() ? j[key].get<int>() : fallback;
}

bool bool_field(const json& j, const char* key, bool fallback) {
    return j.contains(key) && j[key].is_boolean() ? j[key].get<bool>() : fallback;
}

std::optional<Regexp> parse_regexp(const json& j);

// Nested pattern of a group-like node. A missing or null key gives an empty
// pattern; anything else that is not a Regexp object fails the load.
bool parse_nested(const json& j, const char* key, std::unique_ptr<Regexp>& out) {
    if (!j.contains(key) || j[key].is_null()) {
        out = std::make_unique<Regexp>();
        return true;
    }
    auto nested = parse_regexp(j[key]);
    if (!nested) return false;
    out = std::make_unique<Regexp>(std::move(*nested));
    return true;
}

AnchorKind anchor_kind_from_string(const std::string& s) {
    if (s == "start") return AnchorKind::Start;
    if (s == "end") return AnchorKind::End;
    if (s == "word_boundary") return AnchorKind::WordBoundary;
    if (s == "non_word_boundary") return AnchorKind::NonWordBoundary;
    if (s == "string_start") return AnchorKind::StringStart;
    if (s == "string_end") return AnchorKind::StringEnd;
    if (s == "absolute_end") return AnchorKind::AbsoluteEnd;
    if (s == "word_start") return AnchorKind::WordStart;
    if (s == "word_end") return AnchorKind::WordEnd;
    if (s == "end_of_previous_match") return AnchorKind::EndOfPreviousMatch;
    if (s == "grapheme_cluster_boundary") return AnchorKind::GraphemeClusterBoundary;
    spdlog::warn("unknown anchor type '{}'", s);
    return AnchorKind::Other;
}

GroupKind group_kind_from_string(const std::string& s) {
    if (s == "capture") return GroupKind::Capture;
    if (s == "named_capture") return GroupKind::NamedCapture;
    if (s == "non_capture") return GroupKind::NonCapture;
    if (s == "positive_lookahead") return GroupKind::PositiveLookahead;
    if (s == "negative_lookahead") return GroupKind::NegativeLookahead;
    if (s == "positive_lookbehind") return GroupKind::PositiveLookbehind;
    if (s == "negative_lookbehind") return GroupKind::NegativeLookbehind;
    if (s == "non_atomic_positive_lookahead") return GroupKind::NonAtomicPositiveLookahead;
    if (s == "non_atomic_positive_lookbehind") return GroupKind::NonAtomicPositiveLookbehind;
    if (s == "atomic") return GroupKind::Atomic;
    if (s == "script_run") return GroupKind::ScriptRun;
    if (s == "atomic_script_run") return GroupKind::AtomicScriptRun;
    spdlog::warn("unknown group type '{}'", s);
    return GroupKind::Other;
}

PosixClassName posix_from_string(const std::string& s) {
    static const std::pair<const char*, PosixClassName> names[] = {
        { "alnum", PosixClassName::Alnum }, { "alpha", PosixClassName::Alpha },
        { "blank", PosixClassName::Blank }, { "cntrl", PosixClassName::Cntrl },
        { "digit", PosixClassName::Digit }, { "graph", PosixClassName::Graph },
        { "lower", PosixClassName::Lower }, { "print", PosixClassName::Print },
        { "punct", PosixClassName::Punct }, { "space", PosixClassName::Space },
        { "upper", PosixClassName::Upper }, { "xdigit", PosixClassName::Xdigit },
    };
    for (const auto& [name, value] : names)
        if (s == name) return value;
    return PosixClassName::Other;
}

Escape parse_escape(const json& j) {
    Escape e;
    e.escape_type = string_field(j, "escape_type");
    e.code = string_field(j, "code");
    e.value = string_field(j, "value");
    return e;
}

std::optional<CharsetItem> parse_charset_item(const json& j) {
    if (!j.is_object()) return std::nullopt;

    CharsetItem item;
    const std::string type = string_field(j, "type");
    if (type == "charset_literal") {
        item.kind = CharsetItem::Kind::Literal;
        item.text = string_field(j, "text");
    } else if (type == "charset_range") {
        item.kind = CharsetItem::Kind::Range;
        item.text = string_field(j, "first");
        item.last = string_field(j, "last");
    } else if (type == "escape") {
        item.kind = CharsetItem::Kind::Escape;
        item.escape = parse_escape(j);
    } else if (type == "posix_class") {
        item.kind = CharsetItem::Kind::PosixClass;
        item.text = string_field(j, "name");
        item.posix = posix_from_string(item.text);
        item.negated = bool_field(j, "negated", false);
    } else if (type == "set_operation") {
        item.kind = CharsetItem::Kind::SetOperation;
        item.set_operator = string_field(j, "operator") == "subtraction"
            ? SetOperator::Subtraction : SetOperator::Intersection;
        if (j.contains("operands") && j["operands"].is_array()) {
            for (const auto& operand : j["operands"]) {
                auto parsed = parse_charset_item(operand);
                if (!parsed) return std::nullopt;
                item.items.push_back(std::move(*parsed));
            }
        }
    } else if (type == "nested_class") {
        item.kind = CharsetItem::Kind::NestedClass;
        item.negated = bool_field(j, "inverted", false);
        if (j.contains("items") && j["items"].is_array()) {
            for (const auto& member : j["items"]) {
                auto parsed = parse_charset_item(member);
                if (!parsed) return std::nullopt;
                item.items.push_back(std::move(*parsed));
            }
        }
    } else if (type == "string_disjunction") {
        item.kind = CharsetItem::Kind::StringDisjunction;
        if (j.contains("strings") && j["strings"].is_array()) {
            for (const auto& s : j["strings"])
                if (s.is_string()) item.strings.push_back(s.get<std::string>());
        }
    } else {
        // Kept as a literal line carrying whatever text it has.
        spdlog::warn("unknown charset item type '{}'", type);
        item.kind = CharsetItem::Kind::Literal;
        item.text = string_field(j, "text");
    }
    return item;
}

Condition parse_condition(const json& j) {
    Condition c;
    const std::string kind = string_field(j, "kind");
    c.name = string_field(j, "name");
    c.group_number = int_field(j, "group_number", 0);
    if (kind == "recursion") {
        c.kind = Condition::Kind::Recursion;
    } else if (kind == "define") {
        c.kind = Condition::Kind::Define;
    } else if (kind == "assertion") {
        c.kind = Condition::Kind::Assertion;
        c.assertion = group_kind_from_string(string_field(j, "assertion"));
    } else if (kind == "expression") {
        c.kind = Condition::Kind::Expression;
    } else {
        c.kind = Condition::Kind::GroupMatched;
    }
    return c;
}

std::optional<Content> parse_content(const json& j) {
    if (!j.is_object()) return std::nullopt;
    const std::string type = string_field(j, "type");

    if (type == "literal") return Literal{ string_field(j, "text") };
    if (type == "any_character") return AnyCharacter{};
    if (type == "quoted_literal") return QuotedLiteral{ string_field(j, "text") };
    if (type == "comment") return Comment{ string_field(j, "text") };
    if (type == "escape") return parse_escape(j);
    if (type == "recursive_ref") return RecursiveRef{ string_field(j, "target") };
    if (type == "backtrack_control") return BacktrackControl{ string_field(j, "verb"), string_field(j, "arg") };
    if (type == "back_reference")
        return BackReference{ int_field(j, "number", 0), string_field(j, "name") };
    if (type == "unicode_property_escape")
        return UnicodePropertyEscape{ string_field(j, "property"), bool_field(j, "negated", false) };

    if (type == "anchor") {
        Anchor a;
        a.raw_type = string_field(j, "anchor_type");
        a.kind = anchor_kind_from_string(a.raw_type);
        return a;
    }

    if (type == "callout") {
        Callout c;
        c.number = int_field(j, "number", -1);
        c.text = string_field(j, "text");
        return c;
    }

    if (type == "charset") {
        Charset cs;
        cs.inverted = bool_field(j, "inverted", false);
        if (j.contains("items") && j["items"].is_array()) {
            for (const auto& item : j["items"]) {
                auto parsed = parse_charset_item(item);
                if (!parsed) return std::nullopt;
                cs.items.push_back(std::move(*parsed));
            }
        }
        return cs;
    }

    if (type == "subexp") {
        Subexp s;
        s.raw_type = string_field(j, "group_type");
        s.kind = s.raw_type.empty() ? GroupKind::Capture : group_kind_from_string(s.raw_type);
        s.number = int_field(j, "number", 0);
        s.name = string_field(j, "name");
        if (!parse_nested(j, "regexp", s.regexp)) return std::nullopt;
        return s;
    }

    if (type == "branch_reset") {
        BranchReset b;
        if (!parse_nested(j, "regexp", b.regexp)) return std::nullopt;
        return b;
    }

    if (type == "balanced_group") {
        BalancedGroup b;
        b.name = string_field(j, "name");
        b.other_name = string_field(j, "other_name");
        if (!parse_nested(j, "regexp", b.regexp)) return std::nullopt;
        return b;
    }

    if (type == "inline_modifier") {
        InlineModifier m;
        m.enable = string_field(j, "enable");
        m.disable = string_field(j, "disable");
        // Global form (?i) carries no nested pattern.
        if (j.contains("regexp") && !j["regexp"].is_null()) {
            if (!parse_nested(j, "regexp", m.regexp)) return std::nullopt;
        }
        return m;
    }

    if (type == "conditional") {
        Conditional c;
        if (j.contains("condition") && j["condition"].is_object())
            c.condition = parse_condition(j["condition"]);
        if (!parse_nested(j, "true_branch", c.true_branch)) return std::nullopt;
        if (j.contains("false_branch") && !j["false_branch"].is_null()) {
            if (!parse_nested(j, "false_branch", c.false_branch)) return std::nullopt;
        }
        return c;
    }

    return Unknown{ type.empty() ? std::string("unknown") : type };
}

std::optional<Repeat> parse_repeat(const json& j) {
    if (!j.is_object()) return std::nullopt;
    Repeat r;
    r.min = int_field(j, "min", 0);
    r.max = int_field(j, "max", -1);
    r.greedy = bool_field(j, "greedy", true);
    r.possessive = bool_field(j, "possessive", false);
    return r;
}

std::optional<MatchFragment> parse_fragment(const json& j) {
    if (!j.is_object() || !j.contains("content")) return std::nullopt;
    auto content = parse_content(j["content"]);
    if (!content) return std::nullopt;

    MatchFragment f{ std::move(*content), std::nullopt };
    if (j.contains("repeat") && !j["repeat"].is_null()) {
        f.repeat = parse_repeat(j["repeat"]);
        if (!f.repeat) return std::nullopt;
    }
    return f;
}

std::optional<Regexp> parse_regexp(const json& j) {
    if (!j.is_object() || !j.contains("matches") || !j["matches"].is_array()) return std::nullopt;

    Regexp r;
    for (const auto& m : j["matches"]) {
        Match match;
        if (!m.is_object()) return std::nullopt;
        if (m.contains("fragments") && m["fragments"].is_array()) {
            for (const auto& f : m["fragments"]) {
                auto fragment = parse_fragment(f);
                if (!fragment) return std::nullopt;
                match.fragments.push_back(std::move(*fragment));
            }
        }
        r.matches.push_back(std::move(match));
    }

    r.flags = string_field(j, "flags");
    if (j.contains("options") && j["options"].is_array()) {
        for (const auto& o : j["options"]) {
            if (!o.is_object()) continue;
            r.options.push_back({ string_field(o, "name"), string_field(o, "value") });
        }
    }
    return r;
}

std::optional<RegexDocument> parse_document(const json& j) {
    if (!j.is_object()) return std::nullopt;

    RegexDocument doc;
    doc.pattern = string_field(j, "pattern");
    doc.flavor = string_field(j, "flavor");

    if (j.contains("error") && j["error"].is_object()) {
        const json& e = j["error"];
        ParseFailure failure;
        failure.message = string_field(e, "message");
        failure.line = int_field(e, "line", 0);
        failure.column = int_field(e, "column", 0);
        failure.pattern = doc.pattern;
        doc.error = std::move(failure);
        return doc;
    }

    // Bare Regexp without the document envelope.
    const json& ast = j.contains("ast") ? j["ast"] : j;
    doc.ast = parse_regexp(ast);
    if (!doc.ast) return std::nullopt;
    return doc;
}

template <typename Field>
void overlay(const json& j, const char* key, Field& field) {
    if (!j.contains(key)) return;
    const json& v = j[key];
    if constexpr (std::is_same_v<Field, double>) {
        if (v.is_number()) {
            field = v.get<double>();
            return;
        }
    } else if constexpr (std::is_same_v<Field, std::string>) {
        if (v.is_string()) {
            field = v.get<std::string>();
            return;
        }
    } else {
        if (v.is_array()) {
            Field colors;
            for (const auto& c : v) {
                if (!c.is_string()) {
                    spdlog::warn("config key '{}' must hold strings, ignored", key);
                    return;
                }
                colors.push_back(c.get<std::string>());
            }
            field = std::move(colors);
            return;
        }
    }
    spdlog::warn("config key '{}' has the wrong type, ignored", key);
}

std::optional<diagram_render::Config> parse_config(const json& j, diagram_render::Config config) {
    if (!j.is_object()) return std::nullopt;

    overlay(j, "padding", config.padding);
    overlay(j, "horizontal_gap", config.horizontal_gap);
    overlay(j, "vertical_gap", config.vertical_gap);
    overlay(j, "corner_radius", config.corner_radius);
    overlay(j, "font_family", config.font_family);
    overlay(j, "font_size", config.font_size);
    overlay(j, "char_width", config.char_width);
    overlay(j, "background_color", config.background_color);
    overlay(j, "text_color", config.text_color);
    overlay(j, "line_color", config.line_color);
    overlay(j, "line_width", config.line_width);
    overlay(j, "literal_fill", config.literal_fill);
    overlay(j, "charset_fill", config.charset_fill);
    overlay(j, "escape_fill", config.escape_fill);
    overlay(j, "anchor_fill", config.anchor_fill);
    overlay(j, "subexp_fill", config.subexp_fill);
    overlay(j, "subexp_stroke", config.subexp_stroke);
    overlay(j, "subexp_colors", config.subexp_colors);
    overlay(j, "any_char_fill", config.any_char_fill);
    overlay(j, "flags_fill", config.flags_fill);
    overlay(j, "repeat_label_color", config.repeat_label_color);
    overlay(j, "recursive_ref_fill", config.recursive_ref_fill);
    overlay(j, "callout_fill", config.callout_fill);
    overlay(j, "backtrack_control_fill", config.backtrack_control_fill);
    overlay(j, "conditional_fill", config.conditional_fill);
    return config;
}

} // namespace

std::optional<RegexDocument> load_regex_document_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        auto doc = parse_document(j);
        if (!doc) spdlog::error("input is not a pattern document or a Regexp object");
        return doc;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("invalid pattern JSON: {}", e.what());
        return std::nullopt;
    }
}

std::optional<RegexDocument> load_regex_document_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        spdlog::error("cannot open '{}'", path);
        return std::nullopt;
    }
    return load_regex_document_from_json(f);
}

std::optional<diagram_render::Config> load_config_from_json(std::istream& in, diagram_render::Config base) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        auto config = parse_config(j, std::move(base));
        if (!config) spdlog::error("config must be a JSON object");
        return config;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("invalid config JSON: {}", e.what());
        return std::nullopt;
    }
}

std::optional<diagram_render::Config> load_config_from_json_file(const std::string& path,
    diagram_render::Config base)
{
    std::ifstream f(path);
    if (!f) {
        spdlog::error("cannot open config '{}'", path);
        return std::nullopt;
    }
    return load_config_from_json(f, std::move(base));
}

} // namespace regex_loaders
