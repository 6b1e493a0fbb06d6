#include <svg_canvas/elements.hpp>
#include <svg_canvas/format.hpp>

namespace svg_canvas {

namespace {

void append_number_attr(std::string& out, const char* name, double value) {
    out += ' ';
    out += name;
    out += "=\"";
    append_number(out, value);
    out += '"';
}

void append_text_attr(std::string& out, const char* name, const std::string& value) {
    out += ' ';
    out += name;
    out += "=\"";
    append_escaped(out, value);
    out += '"';
}

void append_optional_attr(std::string& out, const char* name, const std::string& value) {
    if (!value.empty()) append_text_attr(out, name, value);
}

} // namespace

std::string Element::to_string() const {
    std::string out;
    render(out);
    return out;
}

Group& Group::add(ElementPtr child) {
    if (child) children.push_back(std::move(child));
    return *this;
}

void Group::render(std::string& out) const {
    out += "<g";
    append_optional_attr(out, "class", css_class);
    if (translate_x != 0 || translate_y != 0) {
        out += " transform=\"translate(";
        append_number(out, translate_x);
        out += ',';
        append_number(out, translate_y);
        out += ")\"";
    }
    out += '>';
    for (const auto& child : children)
        child->render(out);
    out += "</g>";
}

void Rect::render(std::string& out) const {
    out += "<rect";
    append_number_attr(out, "x", x);
    append_number_attr(out, "y", y);
    append_number_attr(out, "width", width);
    append_number_attr(out, "height", height);
    if (rx > 0) append_number_attr(out, "rx", rx);
    if (ry > 0) append_number_attr(out, "ry", ry);
    append_optional_attr(out, "fill", fill);
    append_optional_attr(out, "stroke", stroke);
    if (stroke_width > 0) append_number_attr(out, "stroke-width", stroke_width);
    append_optional_attr(out, "class", css_class);
    out += "/>";
}

void TSpan::render(std::string& out) const {
    out += "<tspan";
    append_optional_attr(out, "class", css_class);
    out += '>';
    append_escaped(out, content);
    out += "</tspan>";
}

void Text::render(std::string& out) const {
    out += "<text";
    append_number_attr(out, "x", x);
    append_number_attr(out, "y", y);
    append_optional_attr(out, "font-family", font_family);
    if (font_size > 0) append_number_attr(out, "font-size", font_size);
    append_optional_attr(out, "fill", fill);
    append_optional_attr(out, "text-anchor", anchor);
    append_optional_attr(out, "class", css_class);
    out += '>';
    if (!spans.empty()) {
        for (const auto& span : spans)
            span.render(out);
    } else {
        append_escaped(out, content);
    }
    out += "</text>";
}

void Path::render(std::string& out) const {
    out += "<path";
    append_text_attr(out, "d", d);
    append_text_attr(out, "fill", fill.empty() ? std::string("none") : fill);
    append_optional_attr(out, "stroke", stroke);
    if (stroke_width > 0) append_number_attr(out, "stroke-width", stroke_width);
    append_optional_attr(out, "class", css_class);
    out += "/>";
}

void Line::render(std::string& out) const {
    out += "<line";
    append_number_attr(out, "x1", x1);
    append_number_attr(out, "y1", y1);
    append_number_attr(out, "x2", x2);
    append_number_attr(out, "y2", y2);
    append_optional_attr(out, "stroke", stroke);
    if (stroke_width > 0) append_number_attr(out, "stroke-width", stroke_width);
    append_optional_attr(out, "class", css_class);
    out += "/>";
}

Svg& Svg::add(ElementPtr child) {
    if (child) children.push_back(std::move(child));
    return *this;
}

void Svg::render(std::string& out) const {
    out += "<svg xmlns=\"http://www.w3.org/2000/svg\"";
    append_number_attr(out, "width", width);
    append_number_attr(out, "height", height);
    out += " viewBox=\"0 0 ";
    append_number(out, width);
    out += ' ';
    append_number(out, height);
    out += '"';
    out += '>';
    if (!style.empty()) {
        out += "<style>";
        append_escaped(out, style);
        out += "</style>";
    }
    for (const auto& child : children)
        child->render(out);
    out += "</svg>";
}

} // namespace svg_canvas
