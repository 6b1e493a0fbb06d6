#include <diagram_layout/connectors.hpp>
#include <diagram_layout/layout_constants.hpp>
#include <diagram_layout/path_builder.hpp>
#include <algorithm>
#include <cmath>

namespace diagram_layout {

using namespace layout;

namespace {

// Bend radius that still fits when the branch sits close to the trunk.
double bend_radius(double trunk_y, double branch_y) {
    return std::min(curve_radius, std::abs(trunk_y - branch_y) * 0.5);
}

} // namespace

BranchPosition classify_branch(double branch_anchor_y, double trunk_anchor_y) {
    if (branch_anchor_y < trunk_anchor_y) return BranchPosition::Above;
    if (branch_anchor_y > trunk_anchor_y) return BranchPosition::Below;
    return BranchPosition::Level;
}

std::string branch_entry_path(double trunk_y, double branch_y, double branch_left) {
    PathBuilder pb;
    pb.move_to(0, trunk_y);

    const BranchPosition pos = classify_branch(branch_y, trunk_y);
    if (pos == BranchPosition::Level) {
        pb.horizontal_to(branch_left);
        return pb.str();
    }

    const double r = bend_radius(trunk_y, branch_y);
    const double dir = pos == BranchPosition::Above ? -1.0 : 1.0;
    pb.quadratic_to(curve_radius, trunk_y, curve_radius, trunk_y + dir * r);
    pb.vertical_to(branch_y - dir * r);
    pb.quadratic_to(curve_radius, branch_y, connector_width, branch_y);
    if (branch_left > connector_width)
        pb.horizontal_to(branch_left);
    return pb.str();
}

std::string branch_exit_path(double width, double trunk_y, double branch_y, double branch_right) {
    PathBuilder pb;
    pb.move_to(branch_right, branch_y);

    const BranchPosition pos = classify_branch(branch_y, trunk_y);
    if (pos == BranchPosition::Level) {
        pb.horizontal_to(width);
        return pb.str();
    }

    const double r = bend_radius(trunk_y, branch_y);
    const double dir = pos == BranchPosition::Above ? 1.0 : -1.0;
    const double bend_x = width - curve_radius;
    if (branch_right < width - connector_width)
        pb.horizontal_to(width - connector_width);
    pb.quadratic_to(bend_x, branch_y, bend_x, branch_y + dir * r);
    pb.vertical_to(trunk_y - dir * r);
    pb.quadratic_to(bend_x, trunk_y, width, trunk_y);
    return pb.str();
}

std::string sequence_path(const std::vector<RenderedNode>& items, double anchor_y) {
    if (items.size() < 2) return {};

    PathBuilder pb;
    pb.move_to(items.front().bbox.anchor_right, anchor_y);
    for (std::size_t i = 1; i < items.size(); ++i) {
        pb.line_to(items[i].bbox.anchor_left, anchor_y);
        if (i + 1 < items.size())
            pb.move_to(items[i].bbox.anchor_right, anchor_y);
    }
    return pb.str();
}

std::string skip_path(double width, double anchor_y, double skip_y) {
    PathBuilder pb;
    pb.move_to(0, anchor_y)
        .quadratic_to(0, skip_y, curve_radius, skip_y)
        .horizontal_to(width - curve_radius)
        .quadratic_to(width, skip_y, width, anchor_y);
    return pb.str();
}

std::string loop_path(double width, double anchor_y, double loop_y) {
    PathBuilder pb;
    pb.move_to(width, anchor_y)
        .quadratic_to(width, loop_y, width - curve_radius, loop_y)
        .horizontal_to(curve_radius)
        .quadratic_to(0, loop_y, 0, anchor_y);
    return pb.str();
}

std::string loop_arrow_path(double x, double y, bool greedy) {
    const double tail = greedy ? x + arrow_size : x - arrow_size;
    PathBuilder pb;
    pb.move_to(tail, y - arrow_size)
        .line_to(x, y)
        .line_to(tail, y + arrow_size);
    return pb.str();
}

} // namespace diagram_layout
