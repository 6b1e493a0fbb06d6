#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace regex_model {

// Parsed pattern tree handed over by the flavor parsers.
// Strict tree: every nested Regexp is owned by exactly one node.

struct Regexp;

struct Literal {
    std::string text;
};

struct AnyCharacter {};

enum class AnchorKind {
    Start,
    End,
    WordBoundary,
    NonWordBoundary,
    StringStart,
    StringEnd,
    AbsoluteEnd,
    WordStart,
    WordEnd,
    EndOfPreviousMatch,
    GraphemeClusterBoundary,
    Other
};

struct Anchor {
    AnchorKind kind = AnchorKind::Start;
    std::string raw_type; // kept for AnchorKind::Other
};

struct Escape {
    std::string escape_type; // "digit", "word", "newline", ...
    std::string code;        // escape letter(s) as written
    std::string value;       // display text
};

enum class PosixClassName {
    Alnum, Alpha, Blank, Cntrl, Digit, Graph, Lower, Print, Punct, Space, Upper, Xdigit, Other
};

enum class SetOperator { Intersection, Subtraction };

struct CharsetItem {
    enum class Kind { Literal, Range, Escape, PosixClass, SetOperation, NestedClass, StringDisjunction };
    Kind kind = Kind::Literal;
    std::string text;          // literal text, range start, POSIX name (raw)
    std::string last;          // range end
    Escape escape;             // Kind::Escape
    PosixClassName posix = PosixClassName::Other;
    bool negated = false;      // POSIX class [:^x:] or inverted nested class
    SetOperator set_operator = SetOperator::Intersection;
    std::vector<CharsetItem> items; // set operands or nested class members
    std::vector<std::string> strings; // \q{a|b}
};

struct Charset {
    bool inverted = false;
    std::vector<CharsetItem> items;
};

enum class GroupKind {
    Capture,
    NamedCapture,
    NonCapture,
    PositiveLookahead,
    NegativeLookahead,
    PositiveLookbehind,
    NegativeLookbehind,
    NonAtomicPositiveLookahead,
    NonAtomicPositiveLookbehind,
    Atomic,
    ScriptRun,
    AtomicScriptRun,
    Other
};

struct Subexp {
    GroupKind kind = GroupKind::Capture;
    int number = 0;          // capture number, 0 when not capturing
    std::string name;
    std::string raw_type;    // kept for GroupKind::Other
    std::unique_ptr<Regexp> regexp;
};

struct BackReference {
    int number = 0;
    std::string name;
};

struct UnicodePropertyEscape {
    std::string property;
    bool negated = false;
};

struct Condition {
    enum class Kind { GroupMatched, Recursion, Define, Assertion, Expression };
    Kind kind = Kind::GroupMatched;
    int group_number = 0;
    std::string name;        // group name, recursion target or expression text
    GroupKind assertion = GroupKind::PositiveLookahead;
};

struct Conditional {
    Condition condition;
    std::unique_ptr<Regexp> true_branch;
    std::unique_ptr<Regexp> false_branch; // null when there is no else branch
};

struct RecursiveRef {
    std::string target; // "R", "0", group number ("1", "+1", "-2") or name
};

struct BranchReset {
    std::unique_ptr<Regexp> regexp;
};

struct BacktrackControl {
    std::string verb;
    std::string arg;
};

struct Callout {
    int number = 0; // -1 for string callouts
    std::string text;
};

struct Comment {
    std::string text;
};

struct QuotedLiteral {
    std::string text;
};

struct InlineModifier {
    std::string enable;
    std::string disable;
    std::unique_ptr<Regexp> regexp; // null for the global form (?i)
};

struct BalancedGroup {
    std::string name;       // empty for (?<-other>...)
    std::string other_name;
    std::unique_ptr<Regexp> regexp;
};

// Node kind this build does not know about; rendered as a generic box.
struct Unknown {
    std::string kind;
};

using Content = std::variant<
    Literal,
    AnyCharacter,
    Anchor,
    Escape,
    Charset,
    Subexp,
    BackReference,
    UnicodePropertyEscape,
    Conditional,
    RecursiveRef,
    BranchReset,
    BacktrackControl,
    Callout,
    Comment,
    QuotedLiteral,
    InlineModifier,
    BalancedGroup,
    Unknown>;

struct Repeat {
    int min = 0;
    int max = -1; // -1 = unbounded
    bool greedy = true;
    bool possessive = false;
};

struct MatchFragment {
    Content content;
    std::optional<Repeat> repeat;
};

struct Match {
    std::vector<MatchFragment> fragments;
};

struct PatternOption {
    std::string name;  // "UTF", "LIMIT_MATCH", ...
    std::string value; // empty unless the option carries one
};

struct Regexp {
    std::vector<Match> matches; // alternation branches, in rendering order
    std::string flags;
    std::vector<PatternOption> options;
};

} // namespace regex_model
