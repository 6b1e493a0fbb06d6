#pragma once

namespace diagram_layout {

// Fixed connector geometry shared by the layout helpers and the renderer.
// Values in SVG user units.

namespace layout {

constexpr double curve_radius = 10.0;
// Horizontal margin reserved on each side of an alternation for branch curves.
constexpr double connector_width = 2.0 * curve_radius;
constexpr double arrow_size = 5.0;
// Vertical room above content for a skip path / below it for a loop path.
constexpr double skip_height = 2.0 * curve_radius;
constexpr double loop_height = 2.0 * curve_radius;

} // namespace layout
} // namespace diagram_layout
