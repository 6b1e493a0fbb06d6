#include <diagram_layout/spacing.hpp>
#include <algorithm>
#include <cstddef>
#include <limits>

namespace diagram_layout {

svg_canvas::ElementPtr translate_element(svg_canvas::ElementPtr element, double dx, double dy) {
    if (dx == 0 && dy == 0) return element;
    auto group = std::make_unique<svg_canvas::Group>();
    group->translate_x = dx;
    group->translate_y = dy;
    group->add(std::move(element));
    return group;
}

SpacedNodes space_horizontally(std::vector<RenderedNode> items, double gap) {
    SpacedNodes out;
    if (items.empty()) return out;

    double max_anchor_y = items.front().bbox.anchor_y;
    for (const auto& item : items)
        max_anchor_y = std::max(max_anchor_y, item.bbox.anchor_y);

    double x = 0;
    double min_y = std::numeric_limits<double>::max();
    double max_y = std::numeric_limits<double>::lowest();
    for (auto& item : items) {
        const double dx = x - item.bbox.x;
        const double dy = max_anchor_y - item.bbox.anchor_y;
        item.bbox = item.bbox.translated(dx, dy);
        item.element = translate_element(std::move(item.element), dx, dy);

        min_y = std::min(min_y, item.bbox.y);
        max_y = std::max(max_y, item.bbox.y2());
        x = item.bbox.x2() + gap;
    }

    out.bbox.x = 0;
    out.bbox.y = min_y;
    out.bbox.width = items.back().bbox.x2();
    out.bbox.height = max_y - min_y;
    out.bbox.anchor_left = items.front().bbox.anchor_left;
    out.bbox.anchor_right = items.back().bbox.anchor_right;
    out.bbox.anchor_y = max_anchor_y;
    out.items = std::move(items);
    return out;
}

SpacedNodes space_vertically(std::vector<RenderedNode> items, double gap) {
    SpacedNodes out;
    if (items.empty()) return out;

    double max_width = 0;
    for (const auto& item : items)
        max_width = std::max(max_width, item.bbox.width);

    double y = 0;
    for (auto& item : items) {
        const double dx = (max_width - item.bbox.width) * 0.5 - item.bbox.x;
        const double dy = y - item.bbox.y;
        item.bbox = item.bbox.translated(dx, dy);
        item.element = translate_element(std::move(item.element), dx, dy);
        y = item.bbox.y2() + gap;
    }

    const double total_height = items.back().bbox.y2();
    out.bbox.x = 0;
    out.bbox.y = 0;
    out.bbox.width = max_width;
    out.bbox.height = total_height;
    out.bbox.anchor_left = 0;
    out.bbox.anchor_right = max_width;
    out.bbox.anchor_y = total_height * 0.5;
    out.items = std::move(items);
    return out;
}

double measure_text(std::string_view text, double char_width) {
    // Count code points, not bytes, so multi-byte glyphs take one cell.
    std::size_t glyphs = 0;
    for (char ch : text) {
        if ((static_cast<unsigned char>(ch) & 0xC0u) != 0x80u) ++glyphs;
    }
    return static_cast<double>(glyphs) * char_width;
}

} // namespace diagram_layout
