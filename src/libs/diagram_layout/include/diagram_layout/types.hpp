#pragma once

#include <svg_canvas/elements.hpp>
#include <vector>

namespace diagram_layout {

// Box occupied by a rendered sub-diagram plus the points where connectors
// attach. Invariant: y <= anchor_y <= y + height.
struct BoundingBox {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;
    double anchor_left = 0;  // x where the incoming connector attaches
    double anchor_right = 0; // x where the outgoing connector leaves
    double anchor_y = 0;     // y of the horizontal connector line

    double x2() const { return x + width; }
    double y2() const { return y + height; }

    BoundingBox translated(double dx, double dy) const {
        BoundingBox b = *this;
        b.x += dx;
        b.y += dy;
        b.anchor_left += dx;
        b.anchor_right += dx;
        b.anchor_y += dy;
        return b;
    }
};

// Box with anchors on its left/right edges at mid-height.
inline BoundingBox make_box(double x, double y, double width, double height) {
    BoundingBox b;
    b.x = x;
    b.y = y;
    b.width = width;
    b.height = height;
    b.anchor_left = x;
    b.anchor_right = x + width;
    b.anchor_y = y + height * 0.5;
    return b;
}

struct RenderedNode {
    svg_canvas::ElementPtr element;
    BoundingBox bbox;
};

// Result of a spacing pass: repositioned items and their union box.
struct SpacedNodes {
    std::vector<RenderedNode> items;
    BoundingBox bbox;
};

} // namespace diagram_layout
