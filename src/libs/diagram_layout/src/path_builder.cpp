#include <diagram_layout/path_builder.hpp>
#include <svg_canvas/format.hpp>

namespace diagram_layout {

void PathBuilder::command(char cmd) {
    if (!data_.empty()) data_ += ' ';
    data_ += cmd;
}

void PathBuilder::number(double v) {
    data_ += ' ';
    svg_canvas::append_number(data_, v);
}

PathBuilder& PathBuilder::move_to(double x, double y) {
    command('M');
    number(x);
    number(y);
    return *this;
}

PathBuilder& PathBuilder::line_to(double x, double y) {
    command('L');
    number(x);
    number(y);
    return *this;
}

PathBuilder& PathBuilder::horizontal_to(double x) {
    command('H');
    number(x);
    return *this;
}

PathBuilder& PathBuilder::vertical_to(double y) {
    command('V');
    number(y);
    return *this;
}

PathBuilder& PathBuilder::quadratic_to(double cx, double cy, double x, double y) {
    command('Q');
    number(cx);
    number(cy);
    number(x);
    number(y);
    return *this;
}

PathBuilder& PathBuilder::cubic_to(double c1x, double c1y, double c2x, double c2y, double x, double y) {
    command('C');
    number(c1x);
    number(c1y);
    number(c2x);
    number(c2y);
    number(x);
    number(y);
    return *this;
}

PathBuilder& PathBuilder::arc_to(double rx, double ry, double rotation, bool large_arc, bool sweep,
    double x, double y)
{
    command('A');
    number(rx);
    number(ry);
    number(rotation);
    data_ += large_arc ? " 1" : " 0";
    data_ += sweep ? " 1" : " 0";
    number(x);
    number(y);
    return *this;
}

} // namespace diagram_layout
