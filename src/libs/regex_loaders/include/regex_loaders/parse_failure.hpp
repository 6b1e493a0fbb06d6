#pragma once

#include <string>

namespace regex_loaders {

// Syntax error reported by a flavor parser in place of an AST.
struct ParseFailure {
    std::string message;
    int line = 0;   // 1-based, 0 when unknown
    int column = 0; // 1-based, 0 when unknown
    std::string pattern;
};

// Multi-line message with the pattern and a caret under the failing column.
// The caret line is omitted when the column falls outside the pattern.
std::string format_parse_failure(const ParseFailure& failure);

} // namespace regex_loaders
