#include <svg_canvas/format.hpp>
#include <charconv>
#include <cmath>

namespace svg_canvas {

std::string format_number(double value) {
    if (!std::isfinite(value)) return "0";

    char buf[64];
    const auto res = std::to_chars(buf, buf + sizeof(buf), value,
        std::chars_format::fixed, number_precision);
    // Out of range only for magnitudes no diagram reaches.
    if (res.ec != std::errc()) return "0";

    std::string s(buf, res.ptr);
    if (s.find('.') != std::string::npos) {
        while (!s.empty() && s.back() == '0') s.pop_back();
        if (!s.empty() && s.back() == '.') s.pop_back();
    }
    if (s == "-0") s = "0";
    return s;
}

void append_number(std::string& out, double value) {
    out += format_number(value);
}

void append_escaped(std::string& out, std::string_view text) {
    for (char ch : text) {
        switch (ch) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        case '\'': out += "&apos;"; break;
        default: out += ch; break;
        }
    }
}

std::string escape_xml(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    append_escaped(out, text);
    return out;
}

} // namespace svg_canvas
