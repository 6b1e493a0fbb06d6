#pragma once

#include <string>

namespace diagram_layout {

// Accumulates SVG path data ("M x y L x y Q ..."). Numbers use
// svg_canvas::format_number so output is stable across platforms.
class PathBuilder {
public:
    PathBuilder& move_to(double x, double y);
    PathBuilder& line_to(double x, double y);
    PathBuilder& horizontal_to(double x);
    PathBuilder& vertical_to(double y);
    PathBuilder& quadratic_to(double cx, double cy, double x, double y);
    PathBuilder& cubic_to(double c1x, double c1y, double c2x, double c2y, double x, double y);
    PathBuilder& arc_to(double rx, double ry, double rotation, bool large_arc, bool sweep,
        double x, double y);

    bool empty() const { return data_.empty(); }
    const std::string& str() const { return data_; }

private:
    void command(char cmd);
    void number(double v);

    std::string data_;
};

} // namespace diagram_layout
