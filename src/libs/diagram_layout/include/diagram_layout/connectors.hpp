#pragma once

#include <diagram_layout/types.hpp>
#include <string>
#include <vector>

namespace diagram_layout {

// Where an alternation branch's connector line sits relative to the
// alternation's own connector line.
enum class BranchPosition {
    Above,  // branch anchor strictly above: curve up from the trunk
    Below,  // branch anchor strictly below: curve down from the trunk
    Level   // same height: straight horizontal segment
};

BranchPosition classify_branch(double branch_anchor_y, double trunk_anchor_y);

// Entry connector from (0, trunk_y) to the branch's left anchor.
std::string branch_entry_path(double trunk_y, double branch_y, double branch_left);

// Exit connector from the branch's right anchor to (width, trunk_y).
std::string branch_exit_path(double width, double trunk_y, double branch_y, double branch_right);

// One path through every sibling: each item's anchor_right to the next
// item's anchor_left along anchor_y. Empty for fewer than two items.
std::string sequence_path(const std::vector<RenderedNode>& items, double anchor_y);

// Bypass track over the content from (0, anchor_y) to (width, anchor_y),
// running along skip_y.
std::string skip_path(double width, double anchor_y, double skip_y);

// Return track under the content from (width, anchor_y) back to (0, anchor_y)
// through loop_y.
std::string loop_path(double width, double anchor_y, double loop_y);

// Chevron centered at (x, y). Greedy points back toward the start (left),
// lazy points forward (right).
std::string loop_arrow_path(double x, double y, bool greedy);

} // namespace diagram_layout
