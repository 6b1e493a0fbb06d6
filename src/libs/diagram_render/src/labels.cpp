#include <diagram_render/labels.hpp>
#include <cstdlib>

namespace diagram_render {

using namespace regex_model;

namespace {

std::string quoted(const std::string& s) {
    return "'" + s + "'";
}

std::string join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

// Verb with an optional argument: "prune" / "prune 'x'".
std::string verb_with_arg(const char* verb, const std::string& arg) {
    if (arg.empty()) return verb;
    return std::string(verb) + " " + quoted(arg);
}

} // namespace

std::string anchor_label(const Anchor& anchor) {
    switch (anchor.kind) {
    case AnchorKind::Start: return "Start of line";
    case AnchorKind::End: return "End of line";
    case AnchorKind::WordBoundary: return "Word boundary";
    case AnchorKind::NonWordBoundary: return "Non-word boundary";
    case AnchorKind::StringStart: return "Start of input";
    case AnchorKind::StringEnd: return "End of input";
    case AnchorKind::AbsoluteEnd: return "Absolute end";
    case AnchorKind::WordStart: return "Start of word";
    case AnchorKind::WordEnd: return "End of word";
    case AnchorKind::EndOfPreviousMatch: return "End of previous match";
    case AnchorKind::GraphemeClusterBoundary: return "Grapheme cluster boundary";
    case AnchorKind::Other: break;
    }
    return anchor.raw_type;
}

std::string group_title(const Subexp& subexp) {
    switch (subexp.kind) {
    case GroupKind::Capture: return "group #" + std::to_string(subexp.number);
    case GroupKind::NamedCapture: return "group #" + std::to_string(subexp.number) + " " + quoted(subexp.name);
    case GroupKind::NonCapture: return "non-capturing group";
    case GroupKind::PositiveLookahead: return "positive lookahead";
    case GroupKind::NegativeLookahead: return "negative lookahead";
    case GroupKind::PositiveLookbehind: return "positive lookbehind";
    case GroupKind::NegativeLookbehind: return "negative lookbehind";
    case GroupKind::NonAtomicPositiveLookahead: return "non-atomic lookahead";
    case GroupKind::NonAtomicPositiveLookbehind: return "non-atomic lookbehind";
    case GroupKind::Atomic: return "atomic group";
    case GroupKind::ScriptRun: return "script run";
    case GroupKind::AtomicScriptRun: return "atomic script run";
    case GroupKind::Other: break;
    }
    return subexp.raw_type;
}

std::string balanced_group_title(const BalancedGroup& group) {
    if (group.name.empty())
        return "balance (pop " + quoted(group.other_name) + ")";
    return "balanced group " + quoted(group.name) + " (pop " + quoted(group.other_name) + ")";
}

std::string back_reference_label(const BackReference& ref) {
    if (!ref.name.empty()) return "back reference " + quoted(ref.name);
    return "back reference #" + std::to_string(ref.number);
}

std::string unicode_property_label(const UnicodePropertyEscape& escape) {
    return (escape.negated ? "NOT Unicode " : "Unicode ") + escape.property;
}

std::string posix_class_label(PosixClassName name, const std::string& raw_name, bool negated) {
    std::string label;
    switch (name) {
    case PosixClassName::Alnum: label = "alphanumeric"; break;
    case PosixClassName::Alpha: label = "alphabetic"; break;
    case PosixClassName::Blank: label = "blank (space/tab)"; break;
    case PosixClassName::Cntrl: label = "control character"; break;
    case PosixClassName::Digit: label = "digit"; break;
    case PosixClassName::Graph: label = "visible character"; break;
    case PosixClassName::Lower: label = "lowercase"; break;
    case PosixClassName::Print: label = "printable"; break;
    case PosixClassName::Punct: label = "punctuation"; break;
    case PosixClassName::Space: label = "whitespace"; break;
    case PosixClassName::Upper: label = "uppercase"; break;
    case PosixClassName::Xdigit: label = "hex digit"; break;
    case PosixClassName::Other: label = raw_name; break;
    }
    return negated ? "NOT " + label : label;
}

std::string charset_item_label(const CharsetItem& item) {
    switch (item.kind) {
    case CharsetItem::Kind::Literal:
        return "\"" + item.text + "\"";
    case CharsetItem::Kind::Range:
        return "\"" + item.text + "\" - \"" + item.last + "\"";
    case CharsetItem::Kind::Escape:
        return item.escape.value;
    case CharsetItem::Kind::PosixClass:
        return posix_class_label(item.posix, item.text, item.negated);
    case CharsetItem::Kind::SetOperation: {
        std::vector<std::string> operands;
        for (const auto& operand : item.items)
            operands.push_back(charset_item_label(operand));
        return join(operands, item.set_operator == SetOperator::Intersection ? " and " : " minus ");
    }
    case CharsetItem::Kind::NestedClass: {
        std::vector<std::string> members;
        for (const auto& member : item.items)
            members.push_back(charset_item_label(member));
        return (item.negated ? "[^" : "[") + join(members, ", ") + "]";
    }
    case CharsetItem::Kind::StringDisjunction: {
        std::vector<std::string> strings;
        for (const auto& s : item.strings)
            strings.push_back("\"" + s + "\"");
        return "one of strings " + join(strings, ", ");
    }
    }
    return item.text;
}

std::string condition_label(const Condition& condition) {
    switch (condition.kind) {
    case Condition::Kind::GroupMatched:
        if (!condition.name.empty()) return "if " + quoted(condition.name) + " matched";
        return "if group " + std::to_string(std::abs(condition.group_number)) + " matched";
    case Condition::Kind::Recursion:
        if (condition.name == "R") return "if in recursion";
        if (condition.name.empty() || condition.name == "DEFINE") return "DEFINE";
        return "if in recursion to " + quoted(condition.name);
    case Condition::Kind::Define:
        return "DEFINE";
    case Condition::Kind::Expression:
        if (condition.name == "DEFINE") return "DEFINE";
        return "if " + condition.name;
    case Condition::Kind::Assertion:
        switch (condition.assertion) {
        case GroupKind::PositiveLookahead: return "if followed by...";
        case GroupKind::NegativeLookahead: return "if not followed by...";
        case GroupKind::PositiveLookbehind: return "if preceded by...";
        case GroupKind::NegativeLookbehind: return "if not preceded by...";
        default: return "if assertion";
        }
    }
    return "if condition";
}

std::string recursive_ref_label(const RecursiveRef& ref) {
    if (ref.target == "R" || ref.target == "0") return "recurse whole pattern";
    if (ref.target.empty()) return "recurse";
    const char first = ref.target.front();
    if (first == '+' || first == '-' || (first >= '0' && first <= '9'))
        return "recurse to group " + ref.target;
    return "recurse to " + quoted(ref.target);
}

std::string backtrack_control_label(const BacktrackControl& control) {
    const std::string& verb = control.verb;
    if (verb == "ACCEPT") return "accept match";
    if (verb == "FAIL" || verb == "F") return "force fail";
    if (verb == "COMMIT") return "commit (no retry)";
    if (verb == "MARK") return verb_with_arg("mark", control.arg);
    if (verb == "PRUNE") return verb_with_arg("prune", control.arg);
    if (verb == "SKIP") return control.arg.empty() ? "skip" : "skip to " + quoted(control.arg);
    if (verb == "THEN") return control.arg.empty() ? "then (try next alt)" : "then " + quoted(control.arg);
    if (control.arg.empty()) return "*" + verb;
    return "*" + verb + ":" + control.arg;
}

std::string callout_label(const Callout& callout) {
    if (callout.number >= 0) return "callout (" + std::to_string(callout.number) + ")";
    return "callout \"" + callout.text + "\"";
}

std::string modifier_label(const InlineModifier& modifier) {
    if (!modifier.enable.empty() && !modifier.disable.empty())
        return "flags: +" + modifier.enable + " -" + modifier.disable;
    if (!modifier.enable.empty()) return "flags: +" + modifier.enable;
    if (!modifier.disable.empty()) return "flags: -" + modifier.disable;
    return "flags";
}

std::string repeat_label(const Repeat& repeat) {
    std::string label;
    if (repeat.min == repeat.max) {
        if (repeat.min != 1) label = std::to_string(repeat.min) + " times";
    } else if (repeat.max == -1) {
        if (repeat.min > 1) label = std::to_string(repeat.min) + "+ times";
    } else if (!(repeat.min == 0 && repeat.max == 1)) {
        label = std::to_string(repeat.min) + " to " + std::to_string(repeat.max) + " times";
    }

    if (repeat.possessive)
        label = label.empty() ? "possessive" : label + " (possessive)";
    return label;
}

std::vector<std::string> flag_descriptions(std::string_view flags) {
    std::vector<std::string> out;
    for (char f : flags) {
        switch (f) {
        case 'd': out.emplace_back("hasIndices"); break;
        case 'g': out.emplace_back("global"); break;
        case 'i': out.emplace_back("ignore case"); break;
        case 'm': out.emplace_back("multiline"); break;
        case 's': out.emplace_back("dotAll"); break;
        case 'u': out.emplace_back("unicode"); break;
        case 'v': out.emplace_back("unicodeSets"); break;
        case 'y': out.emplace_back("sticky"); break;
        default: out.emplace_back(1, f); break;
        }
    }
    return out;
}

std::string pattern_options_label(const std::vector<PatternOption>& options) {
    std::vector<std::string> parts;
    for (const auto& opt : options) {
        if (opt.value.empty()) parts.push_back("*" + opt.name);
        else parts.push_back("*" + opt.name + "=" + opt.value);
    }
    return "Options: " + join(parts, ", ");
}

} // namespace diagram_render
