#include "boxes.hpp"
#include <diagram_layout/spacing.hpp>
#include <algorithm>
#include <memory>

namespace diagram_render {

namespace {

using diagram_layout::make_box;
using diagram_layout::measure_text;
using diagram_layout::RenderedNode;

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::string::size_type start = 0;
    for (;;) {
        const auto nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

std::unique_ptr<svg_canvas::Rect> box_rect(double width, double height, const Config& config) {
    auto rect = std::make_unique<svg_canvas::Rect>();
    rect->width = width;
    rect->height = height;
    rect->rx = config.corner_radius;
    rect->ry = config.corner_radius;
    return rect;
}

std::unique_ptr<svg_canvas::Text> make_text(double x, double y, double font_size, const Config& config) {
    auto text = std::make_unique<svg_canvas::Text>();
    text->x = x;
    text->y = y;
    text->font_family = config.font_family;
    text->font_size = font_size;
    return text;
}

// Baseline that visually centers one line of text in a box of this height.
double centered_baseline(double height, const Config& config) {
    return height * 0.5 + config.font_size / 3.0;
}

std::unique_ptr<svg_canvas::Line> connector_line(double x1, double x2, double y, const Config& config) {
    auto line = std::make_unique<svg_canvas::Line>();
    line->x1 = x1;
    line->y1 = y;
    line->x2 = x2;
    line->y2 = y;
    line->stroke = config.line_color;
    line->stroke_width = config.line_width;
    return line;
}

} // namespace

RenderedNode label_box(const std::string& text, const std::string& css_class, const Config& config) {
    const double pad = config.padding / 2;
    const double line_height = config.font_size + pad;
    const std::vector<std::string> lines = split_lines(text);

    double text_width = 0;
    for (const auto& line : lines)
        text_width = std::max(text_width, measure_text(line, config.char_width));

    const double width = text_width + 2 * pad;
    const double height = config.font_size + 2 * pad
        + static_cast<double>(lines.size() - 1) * line_height;

    auto group = std::make_unique<svg_canvas::Group>(css_class);
    group->add(box_rect(width, height, config));

    double y = pad + config.font_size * 0.5 + config.font_size / 3.0;
    for (const auto& line : lines) {
        auto t = make_text(width / 2, y, config.font_size, config);
        t->anchor = "middle";
        t->content = line;
        group->add(std::move(t));
        y += line_height;
    }

    return { std::move(group), make_box(0, 0, width, height) };
}

RenderedNode quoted_box(const std::string& text, const std::string& css_class, const Config& config) {
    const double pad = config.padding / 2;
    const double width = measure_text("\"" + text + "\"", config.char_width) + 2 * pad;
    const double height = config.font_size + 2 * pad;

    auto t = make_text(width / 2, centered_baseline(height, config), config.font_size, config);
    t->anchor = "middle";
    t->spans.push_back({ "\"", "quote" });
    t->spans.push_back({ text, "" });
    t->spans.push_back({ "\"", "quote" });

    auto group = std::make_unique<svg_canvas::Group>(css_class);
    group->add(box_rect(width, height, config));
    group->add(std::move(t));
    return { std::move(group), make_box(0, 0, width, height) };
}

RenderedNode list_box(const std::string& heading, const std::vector<std::string>& items,
    const std::string& css_class, const Config& config)
{
    const double pad = config.padding;

    const double heading_width = measure_text(heading, config.char_width);
    double max_item_width = 0;
    for (const auto& item : items)
        max_item_width = std::max(max_item_width, measure_text(item, config.char_width));

    const double content_width = std::max(max_item_width + 2 * pad, heading_width);
    const double heading_height = config.font_size + pad;
    const double item_height = config.font_size + pad / 2;

    const double width = content_width + 2 * pad;
    const double height = heading_height + static_cast<double>(items.size()) * item_height + pad;

    auto group = std::make_unique<svg_canvas::Group>(css_class);
    group->add(box_rect(width, height, config));

    auto label = make_text(pad, config.font_size, config.font_size - 2, config);
    label->content = heading;
    label->css_class = css_class + "-label";
    group->add(std::move(label));

    double y = heading_height + config.font_size;
    for (const auto& item : items) {
        auto t = make_text(width / 2, y, config.font_size, config);
        t->anchor = "middle";
        t->content = item;
        group->add(std::move(t));
        y += item_height;
    }

    return { std::move(group), make_box(0, 0, width, height) };
}

RenderedNode comment_box(const std::string& text, const Config& config) {
    const double pad = config.padding / 2;
    const std::string content = "# " + text;
    const double width = measure_text(content, config.char_width) + 2 * pad;
    const double height = config.font_size + 2 * pad;

    auto t = make_text(width / 2, centered_baseline(height, config), config.font_size - 2, config);
    t->anchor = "middle";
    t->content = content;
    t->css_class = "comment-text";

    auto group = std::make_unique<svg_canvas::Group>("comment");
    group->add(box_rect(width, height, config));
    group->add(std::move(t));
    return { std::move(group), make_box(0, 0, width, height) };
}

RenderedNode banner_box(const std::string& text, const Config& config) {
    const double pad = config.padding / 2;
    const double width = measure_text(text, config.char_width) + 2 * pad;
    const double height = config.font_size + 2 * pad;

    auto rect = box_rect(width, height, config);
    rect->fill = "#e8e8e8";
    rect->stroke = "#999";
    rect->stroke_width = config.line_width;

    auto t = make_text(width / 2, centered_baseline(height, config), config.font_size - 2, config);
    t->anchor = "middle";
    t->content = text;
    t->css_class = "pattern-options-label";

    auto group = std::make_unique<svg_canvas::Group>("pattern-options");
    group->add(std::move(rect));
    group->add(std::move(t));
    return { std::move(group), make_box(0, 0, width, height) };
}

RenderedNode titled_box(const std::string& title, RenderedNode content,
    const std::string& css_class, const std::string& fill, const std::string& stroke,
    const Config& config)
{
    const double pad = config.padding;
    const double title_width = measure_text(title, config.char_width);
    const double title_height = config.font_size + pad;

    const double width = std::max(content.bbox.width, title_width) + 2 * pad;
    const double height = title_height + content.bbox.height + pad;

    const double content_x = (width - content.bbox.width) / 2;
    const double content_y = title_height;
    const double dx = content_x - content.bbox.x;
    const double dy = content_y - content.bbox.y;
    const diagram_layout::BoundingBox placed = content.bbox.translated(dx, dy);

    auto rect = box_rect(width, height, config);
    rect->fill = fill;
    rect->stroke = stroke;
    if (!stroke.empty()) rect->stroke_width = config.line_width;

    auto label = make_text(pad, config.font_size, config.font_size - 2, config);
    label->content = title;
    label->css_class = css_class + "-label";

    auto group = std::make_unique<svg_canvas::Group>(css_class);
    group->add(std::move(rect));
    group->add(std::move(label));
    if (placed.anchor_left > 0)
        group->add(connector_line(0, placed.anchor_left, placed.anchor_y, config));
    if (placed.anchor_right < width)
        group->add(connector_line(placed.anchor_right, width, placed.anchor_y, config));
    group->add(diagram_layout::translate_element(std::move(content.element), dx, dy));

    diagram_layout::BoundingBox bbox = make_box(0, 0, width, height);
    bbox.anchor_y = placed.anchor_y;
    return { std::move(group), bbox };
}

RenderedNode empty_node() {
    return { std::make_unique<svg_canvas::Group>(), make_box(0, 0, 0, 0) };
}

} // namespace diagram_render
