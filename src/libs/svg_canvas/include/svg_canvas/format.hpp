#pragma once

#include <string>
#include <string_view>

namespace svg_canvas {

// Digits kept after the decimal point before trailing zeros are trimmed.
// Ten digits hide FMA / non-FMA rounding noise (68.80000000000001 -> 68.8).
constexpr int number_precision = 10;

// Fixed-precision, locale-independent number text with trailing zeros and a
// trailing '.' removed. Negative zero is written as "0".
std::string format_number(double value);

// Appends format_number(value) to out.
void append_number(std::string& out, double value);

// XML entity escaping for text content and attribute values: & < > " '.
std::string escape_xml(std::string_view text);
void append_escaped(std::string& out, std::string_view text);

} // namespace svg_canvas
