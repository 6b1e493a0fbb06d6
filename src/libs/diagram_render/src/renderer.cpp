#include <diagram_render/renderer.hpp>
#include <diagram_render/labels.hpp>
#include <diagram_layout/spacing.hpp>
#include <svg_canvas/format.hpp>
#include "boxes.hpp"
#include <algorithm>
#include <memory>

namespace diagram_render {

namespace {

using diagram_layout::RenderedNode;

std::unique_ptr<svg_canvas::Line> track_line(double x1, double x2, double y, const Config& config) {
    auto line = std::make_unique<svg_canvas::Line>();
    line->x1 = x1;
    line->y1 = y;
    line->x2 = x2;
    line->y2 = y;
    line->stroke = config.line_color;
    line->stroke_width = config.line_width;
    return line;
}

void add_fill_rule(std::string& css, const char* css_class, const std::string& fill) {
    css += '.';
    css += css_class;
    css += " > rect{fill:" + fill + "}\n";
}

bool has_background(const std::string& color) {
    return !color.empty() && color != "transparent" && color != "none";
}

} // namespace

std::string build_stylesheet(const Config& config) {
    std::string css;
    if (has_background(config.background_color))
        css += "svg{background:" + config.background_color + "}\n";

    css += "text{font-family:" + config.font_family + ";font-size:";
    svg_canvas::append_number(css, config.font_size);
    css += "px;fill:" + config.text_color + "}\n";

    add_fill_rule(css, "literal", config.literal_fill);
    add_fill_rule(css, "escape", config.escape_fill);
    add_fill_rule(css, "charset", config.charset_fill);
    add_fill_rule(css, "anchor", config.anchor_fill);
    add_fill_rule(css, "any-character", config.any_char_fill);
    add_fill_rule(css, "flags", config.flags_fill);
    add_fill_rule(css, "recursive-ref", config.recursive_ref_fill);
    add_fill_rule(css, "callout", config.callout_fill);
    add_fill_rule(css, "backtrack-control", config.backtrack_control_fill);
    add_fill_rule(css, "conditional", config.conditional_fill);
    add_fill_rule(css, "condition-label", "#fff");

    css += ".unknown > rect{fill:#eee;stroke:#999;stroke-dasharray:4,2}\n";
    css += ".comment > rect{fill:#f8f8f8;stroke:#bbb;stroke-dasharray:4,2}\n";
    css += ".comment-text{fill:#777;font-style:italic}\n";
    css += ".anchor text{fill:#fff}\n";
    css += ".quote{fill:" + config.repeat_label_color + "}\n";

    css += ".subexp-label,.conditional-label,.flags-label,.charset-label,.pattern-options-label{font-size:";
    svg_canvas::append_number(css, config.font_size - 2);
    css += "px;font-style:italic}\n";

    css += ".repeat-label{font-size:";
    svg_canvas::append_number(css, config.font_size - 2);
    css += "px;fill:" + config.repeat_label_color + "}\n";
    return css;
}

std::string render(const regex_model::Regexp& ast, const Config& config) {
    const double pad = config.padding;

    RenderedNode banner;
    double banner_height = 0;
    if (!ast.options.empty()) {
        banner = banner_box(pattern_options_label(ast.options), config);
        banner_height = banner.bbox.height + pad / 2;
    }

    RenderedNode content = render_regexp(ast, config, 0);
    const double content_x = pad;
    const double content_y = banner_height + pad;
    const double dx = content_x - content.bbox.x;
    const double dy = content_y - content.bbox.y;
    const diagram_layout::BoundingBox placed = content.bbox.translated(dx, dy);

    double width = content.bbox.width + 2 * pad;
    double inner_height = content.bbox.height;

    RenderedNode flags;
    if (!ast.flags.empty()) {
        flags = list_box("Flags:", flag_descriptions(ast.flags), "flags", config);
        width += flags.bbox.width + pad;
        inner_height = std::max(inner_height, flags.bbox.height);
    }
    if (banner.element)
        width = std::max(width, banner.bbox.width + 2 * pad);

    const double height = banner_height + inner_height + 2 * pad;

    svg_canvas::Svg svg;
    svg.width = width;
    svg.height = height;
    svg.style = build_stylesheet(config);

    svg.add(track_line(pad / 2, placed.anchor_left, placed.anchor_y, config));
    svg.add(track_line(placed.anchor_right, placed.x2() + pad / 2, placed.anchor_y, config));
    svg.add(diagram_layout::translate_element(std::move(content.element), dx, dy));

    if (banner.element) {
        auto g = std::make_unique<svg_canvas::Group>();
        g->translate_x = pad;
        g->translate_y = pad / 2;
        g->add(std::move(banner.element));
        svg.add(std::move(g));
    }

    if (flags.element) {
        auto g = std::make_unique<svg_canvas::Group>();
        g->translate_x = placed.x2() + pad;
        g->translate_y = content_y;
        g->add(std::move(flags.element));
        svg.add(std::move(g));
    }

    std::string out;
    svg.render(out);
    return out;
}

} // namespace diagram_render
