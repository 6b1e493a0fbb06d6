#include <gtest/gtest.h>
#include <svg_canvas/elements.hpp>
#include <svg_canvas/format.hpp>
#include <cmath>
#include <limits>

// Number formatting, escaping and element markup

TEST(FormatNumberTest, TrimsTrailingZeros) {
    EXPECT_EQ(svg_canvas::format_number(10), "10");
    EXPECT_EQ(svg_canvas::format_number(1.5), "1.5");
    EXPECT_EQ(svg_canvas::format_number(-2.25), "-2.25");
    EXPECT_EQ(svg_canvas::format_number(0), "0");
}

TEST(FormatNumberTest, HidesRoundingNoise) {
    EXPECT_EQ(svg_canvas::format_number(68.80000000000001), "68.8");
    EXPECT_EQ(svg_canvas::format_number(0.1 + 0.2), "0.3");
}

TEST(FormatNumberTest, NegativeZeroAndTinyValues) {
    EXPECT_EQ(svg_canvas::format_number(-0.0), "0");
    EXPECT_EQ(svg_canvas::format_number(1e-12), "0");
    EXPECT_EQ(svg_canvas::format_number(-1e-12), "0");
}

TEST(FormatNumberTest, NonFiniteBecomesZero) {
    EXPECT_EQ(svg_canvas::format_number(std::numeric_limits<double>::quiet_NaN()), "0");
    EXPECT_EQ(svg_canvas::format_number(std::numeric_limits<double>::infinity()), "0");
}

TEST(EscapeTest, EscapesAllFiveEntities) {
    EXPECT_EQ(svg_canvas::escape_xml("a<b & 'c' \"d\">"),
        "a&lt;b &amp; &apos;c&apos; &quot;d&quot;&gt;");
    EXPECT_EQ(svg_canvas::escape_xml("plain"), "plain");
    EXPECT_EQ(svg_canvas::escape_xml("\xC3\xA9"), "\xC3\xA9");
}

TEST(ElementTest, BareGroup) {
    svg_canvas::Group g;
    EXPECT_EQ(g.to_string(), "<g></g>");
}

TEST(ElementTest, GroupOmitsZeroTranslate) {
    svg_canvas::Group g("match");
    g.translate_x = 0;
    g.translate_y = 0;
    EXPECT_EQ(g.to_string(), "<g class=\"match\"></g>");

    g.translate_y = 5;
    EXPECT_EQ(g.to_string(), "<g class=\"match\" transform=\"translate(0,5)\"></g>");
}

TEST(ElementTest, RectAttributeOrder) {
    svg_canvas::Rect r;
    r.x = 1;
    r.y = 2;
    r.width = 3;
    r.height = 4;
    EXPECT_EQ(r.to_string(), "<rect x=\"1\" y=\"2\" width=\"3\" height=\"4\"/>");

    r.rx = 3;
    r.ry = 3;
    r.fill = "#fff";
    EXPECT_EQ(r.to_string(), "<rect x=\"1\" y=\"2\" width=\"3\" height=\"4\" rx=\"3\" ry=\"3\" fill=\"#fff\"/>");
}

TEST(ElementTest, PathWithoutFillIsUnfilled) {
    svg_canvas::Path p;
    p.d = "M 0 0 H 10";
    p.stroke = "#000";
    p.stroke_width = 2;
    EXPECT_EQ(p.to_string(), "<path d=\"M 0 0 H 10\" fill=\"none\" stroke=\"#000\" stroke-width=\"2\"/>");
}

TEST(ElementTest, TextEscapesContentAndSpans) {
    svg_canvas::Text t;
    t.x = 5;
    t.y = 6;
    t.content = "a<b";
    EXPECT_EQ(t.to_string(), "<text x=\"5\" y=\"6\">a&lt;b</text>");

    t.spans.push_back({ "\"", "quote" });
    t.spans.push_back({ "x&y", "" });
    EXPECT_EQ(t.to_string(),
        "<text x=\"5\" y=\"6\"><tspan class=\"quote\">&quot;</tspan><tspan>x&amp;y</tspan></text>");
}

TEST(ElementTest, SvgRoot) {
    svg_canvas::Svg svg;
    svg.width = 100.5;
    svg.height = 40;
    svg.style = "a > b{}";
    svg.add(std::make_unique<svg_canvas::Group>());
    EXPECT_EQ(svg.to_string(),
        "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"100.5\" height=\"40\" viewBox=\"0 0 100.5 40\">"
        "<style>a &gt; b{}</style><g></g></svg>");
}

TEST(ElementTest, NestedGroupsRenderChildrenInOrder) {
    auto inner = std::make_unique<svg_canvas::Line>();
    inner->x2 = 10;
    svg_canvas::Group g;
    g.add(std::make_unique<svg_canvas::Group>("first"));
    g.add(std::move(inner));
    g.add(nullptr);
    EXPECT_EQ(g.children.size(), 2u);
    EXPECT_EQ(g.to_string(),
        "<g><g class=\"first\"></g><line x1=\"0\" y1=\"0\" x2=\"10\" y2=\"0\"/></g>");
}
