#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace diagram_render {

// Styling and dimensions for one render pass. Read-only while rendering, so a
// single Config may be shared by concurrent renders. Values are not validated.
struct Config {
    // Dimensions.
    double padding = 10;
    double horizontal_gap = 10;
    double vertical_gap = 5;
    double corner_radius = 3;

    // Typography.
    std::string font_family = "monospace";
    double font_size = 14;
    double char_width = 8.4; // approximate advance of a 14px monospace glyph

    // Colors.
    std::string background_color = "transparent";
    std::string text_color = "#000";
    std::string line_color = "#000";
    double line_width = 2;

    // Per node class.
    std::string literal_fill = "#ff6b6b";
    std::string charset_fill = "#cbcbba";
    std::string escape_fill = "#bada55";
    std::string anchor_fill = "#6b6659";
    std::string subexp_fill = "none";     // outermost group (depth 0)
    std::string subexp_stroke = "#908c83";
    // Cycled for nested groups: depth d >= 1 uses subexp_colors[(d - 1) % size].
    std::vector<std::string> subexp_colors = {
        "#cce5ff", // light blue
        "#d4edda", // light green
        "#fff3cd", // light yellow
        "#f8d7da", // light pink
        "#e2d5f0", // light lavender
    };
    std::string any_char_fill = "#dae9e5";
    std::string flags_fill = "#c8e0f9";
    std::string repeat_label_color = "#666";
    std::string recursive_ref_fill = "#c9b3ff";
    std::string callout_fill = "#ffd699";
    std::string backtrack_control_fill = "#ffb3a7";
    std::string conditional_fill = "#b3e5fc";
};

// Fill for a group box drawn at the given nesting depth.
inline const std::string& subexp_fill_for_depth(const Config& config, int depth) {
    if (depth <= 0 || config.subexp_colors.empty()) return config.subexp_fill;
    const auto index = static_cast<std::size_t>(depth - 1) % config.subexp_colors.size();
    return config.subexp_colors[index];
}

} // namespace diagram_render
