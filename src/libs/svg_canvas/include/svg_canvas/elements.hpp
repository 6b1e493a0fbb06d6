#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace svg_canvas {

// Minimal typed SVG element model. Every element writes its attributes in a
// fixed order so equal trees always produce equal markup.
class Element {
public:
    virtual ~Element() = default;

    // Appends UTF-8 markup for this element (and its children) to out.
    virtual void render(std::string& out) const = 0;

    std::string to_string() const;
};

using ElementPtr = std::unique_ptr<Element>;

// <g>. A group without class and with a zero offset renders as bare <g>...</g>.
struct Group final : Element {
    std::string css_class;
    double translate_x = 0;
    double translate_y = 0;
    std::vector<ElementPtr> children;

    Group() = default;
    explicit Group(std::string cls) : css_class(std::move(cls)) {}

    Group& add(ElementPtr child);
    void render(std::string& out) const override;
};

struct Rect final : Element {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;
    double rx = 0;
    double ry = 0;
    std::string fill;
    std::string stroke;
    double stroke_width = 0;
    std::string css_class;

    void render(std::string& out) const override;
};

struct TSpan {
    std::string content;
    std::string css_class;

    void render(std::string& out) const;
};

struct Text final : Element {
    double x = 0;
    double y = 0;
    std::string content; // ignored when spans is non-empty
    std::string font_family;
    double font_size = 0;
    std::string fill;
    std::string anchor; // text-anchor: start, middle, end
    std::string css_class;
    std::vector<TSpan> spans;

    void render(std::string& out) const override;
};

// <path>. An empty fill is written as fill="none".
struct Path final : Element {
    std::string d;
    std::string fill;
    std::string stroke;
    double stroke_width = 0;
    std::string css_class;

    void render(std::string& out) const override;
};

struct Line final : Element {
    double x1 = 0;
    double y1 = 0;
    double x2 = 0;
    double y2 = 0;
    std::string stroke;
    double stroke_width = 0;
    std::string css_class;

    void render(std::string& out) const override;
};

// Root <svg> document with an optional embedded <style> block.
struct Svg final : Element {
    double width = 0;
    double height = 0;
    std::string style;
    std::vector<ElementPtr> children;

    Svg& add(ElementPtr child);
    void render(std::string& out) const override;
};

} // namespace svg_canvas
