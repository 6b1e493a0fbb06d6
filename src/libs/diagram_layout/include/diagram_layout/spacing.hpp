#pragma once

#include <diagram_layout/types.hpp>
#include <string_view>
#include <vector>

namespace diagram_layout {

// Wraps element in a translated <g>; returns it unchanged for a zero offset.
svg_canvas::ElementPtr translate_element(svg_canvas::ElementPtr element, double dx, double dy);

// Left-to-right placement separated by gap. Every item is shifted down so its
// anchor_y lands on the largest anchor_y of the row; the union box keeps that
// shared anchor line. Empty input gives a zero box.
SpacedNodes space_horizontally(std::vector<RenderedNode> items, double gap);

// Top-to-bottom placement separated by gap, each item centered in the widest
// width. The union box anchors at its left/right edges and mid-height.
SpacedNodes space_vertically(std::vector<RenderedNode> items, double gap);

// Estimated width of text drawn in a monospace font.
double measure_text(std::string_view text, double char_width);

} // namespace diagram_layout
