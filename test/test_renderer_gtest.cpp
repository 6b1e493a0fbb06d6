#include <gtest/gtest.h>
#include "ast_helpers.hpp"
#include <diagram_render/renderer.hpp>
#include <svg_canvas/format.hpp>
#include <string>
#include <vector>

using namespace test_ast;
using diagram_render::Config;

namespace {

// Fill of every group box, in document order.
std::vector<std::string> subexp_fills(const std::string& svg) {
    const std::string marker = "<g class=\"subexp\"><rect";
    std::vector<std::string> fills;
    for (auto pos = svg.find(marker); pos != std::string::npos; pos = svg.find(marker, pos + 1)) {
        const auto start = svg.find("fill=\"", pos) + 6;
        fills.push_back(svg.substr(start, svg.find('"', start) - start));
    }
    return fills;
}

double svg_attribute(const std::string& svg, const std::string& name) {
    const std::string key = " " + name + "=\"";
    const auto start = svg.find(key) + key.size();
    return std::stod(svg.substr(start, svg.find('"', start) - start));
}

void expect_anchor_inside(const diagram_layout::BoundingBox& b) {
    EXPECT_LE(b.y, b.anchor_y);
    EXPECT_LE(b.anchor_y, b.y + b.height);
}

Regexp complex_pattern() {
    Charset digits;
    digits.items.push_back({ CharsetItem::Kind::Range, "0", "9" });

    Conditional cond;
    cond.condition.group_number = 1;
    cond.true_branch = boxed(pattern(literal("x")));
    cond.false_branch = boxed(alternation(sequence(literal("y")), sequence(literal("zz"))));

    Regexp r = alternation(
        sequence(
            fragment(Anchor{ AnchorKind::Start, "start" }),
            capture(1, alternation(sequence(literal("ab")), sequence(literal("c", repeat(0, -1))))),
            fragment(std::move(digits), repeat(2, 4, false))),
        sequence(fragment(std::move(cond)), fragment(AnyCharacter{}, repeat(1, -1))));
    r.flags = "gi";
    return r;
}

} // namespace

TEST(RenderTest, WellFormedDocument) {
    const std::string svg = diagram_render::render(complex_pattern());
    EXPECT_EQ(svg.rfind("<svg", 0), 0u);
    EXPECT_EQ(svg.substr(svg.size() - 6), "</svg>");
    EXPECT_NE(svg.find("xmlns=\"http://www.w3.org/2000/svg\""), std::string::npos);
    EXPECT_NE(svg.find("viewBox=\"0 0 "), std::string::npos);
    EXPECT_EQ(count_of(svg, "<g>") + count_of(svg, "<g "), count_of(svg, "</g>"));
    EXPECT_EQ(count_of(svg, "<text"), count_of(svg, "</text>"));
}

TEST(RenderTest, Deterministic) {
    EXPECT_EQ(diagram_render::render(complex_pattern()), diagram_render::render(complex_pattern()));
}

TEST(RenderTest, EmptyPattern) {
    const std::string svg = diagram_render::render(Regexp{});
    EXPECT_DOUBLE_EQ(svg_attribute(svg, "width"), 20);
    EXPECT_DOUBLE_EQ(svg_attribute(svg, "height"), 20);
    EXPECT_EQ(svg.substr(svg.size() - 6), "</svg>");
}

TEST(RenderTest, LiteralScenario) {
    const std::string svg = diagram_render::render(pattern(literal("abc")));
    EXPECT_EQ(count_of(svg, "class=\"literal\""), 1u);
    EXPECT_NE(svg.find("<tspan class=\"quote\">&quot;</tspan><tspan>abc</tspan><tspan class=\"quote\">&quot;</tspan>"),
        std::string::npos);
}

TEST(RenderTest, LiteralTextIsEscaped) {
    const std::string svg = diagram_render::render(pattern(literal("<&>")));
    EXPECT_NE(svg.find("<tspan>&lt;&amp;&gt;</tspan>"), std::string::npos);
}

TEST(RenderTest, AlternationScenario) {
    const std::string svg = diagram_render::render(
        alternation(sequence(literal("a")), sequence(literal("b")), sequence(literal("c"))));
    EXPECT_EQ(count_of(svg, "class=\"literal\""), 3u);
    EXPECT_EQ(count_of(svg, "<path"), 6u);
    EXPECT_EQ(svg.find("skip-path"), std::string::npos);
    EXPECT_EQ(svg.find("loop-path"), std::string::npos);
}

TEST(RenderTest, AlternationCurveShapes) {
    Config config;
    auto node = diagram_render::render_regexp(
        alternation(sequence(literal("a")), sequence(literal("b")), sequence(literal("c"))), config);
    const std::string out = node.element->to_string();

    // Three equal boxes: trunk at 46, branches at 12, 46 and 80.
    EXPECT_DOUBLE_EQ(node.bbox.anchor_y, 46);
    EXPECT_NE(out.find("d=\"M 0 46 Q 10 46 10 36 V 22 Q 10 12 20 12\""), std::string::npos);
    EXPECT_NE(out.find("d=\"M 0 46 H 20\""), std::string::npos);
    EXPECT_NE(out.find("d=\"M 0 46 Q 10 46 10 56 V 70 Q 10 80 20 80\""), std::string::npos);
}

TEST(RenderTest, GroupNumberingScenario) {
    const std::string svg = diagram_render::render(pattern(capture(1, pattern(literal("abc")))));
    EXPECT_EQ(count_of(svg, "class=\"subexp\""), 1u);
    EXPECT_NE(svg.find(">group #1</text>"), std::string::npos);
    EXPECT_NE(svg.find("<tspan>abc</tspan>"), std::string::npos);
}

TEST(RenderTest, NestedGroupDepthScenario) {
    const std::string svg = diagram_render::render(
        pattern(capture(1, pattern(capture(2, pattern(literal("a"))), capture(3, pattern(literal("b")))))));
    const auto fills = subexp_fills(svg);
    ASSERT_EQ(fills.size(), 3u);
    EXPECT_EQ(fills[0], "none");
    EXPECT_EQ(fills[1], "#cce5ff");
    EXPECT_EQ(fills[2], "#cce5ff");
}

TEST(RenderTest, DepthCyclesThroughShortPalette) {
    Config config;
    config.subexp_colors = { "#111", "#222" };
    Regexp r = pattern(capture(1, pattern(capture(2, pattern(capture(3, pattern(capture(4, pattern(literal("a"))))))))));
    const auto fills = subexp_fills(diagram_render::render(r, config));
    ASSERT_EQ(fills.size(), 4u);
    EXPECT_EQ(fills[0], "none");
    EXPECT_EQ(fills[1], "#111");
    EXPECT_EQ(fills[2], "#222");
    EXPECT_EQ(fills[3], "#111");
}

TEST(RenderTest, SiblingGroupsDoNotInheritDepth) {
    const std::string svg = diagram_render::render(
        pattern(capture(1, pattern(capture(2, pattern(literal("a"))))), capture(3, pattern(literal("b")))));
    const auto fills = subexp_fills(svg);
    ASSERT_EQ(fills.size(), 3u);
    EXPECT_EQ(fills[0], "none");
    EXPECT_EQ(fills[1], "#cce5ff");
    EXPECT_EQ(fills[2], "none");
}

TEST(RenderTest, BalancedAndBranchResetGroupsAddDepth) {
    BranchReset reset;
    reset.regexp = boxed(pattern(capture(1, pattern(literal("a")))));
    BalancedGroup balanced;
    balanced.name = "x";
    balanced.other_name = "y";
    balanced.regexp = boxed(pattern(fragment(std::move(reset))));

    const std::string svg = diagram_render::render(
        pattern(fragment(std::move(balanced)), capture(2, pattern(literal("b")))));
    const auto fills = subexp_fills(svg);
    ASSERT_EQ(fills.size(), 4u);
    EXPECT_EQ(fills[0], "none");
    EXPECT_EQ(fills[1], "#cce5ff");
    EXPECT_EQ(fills[2], "#d4edda");
    EXPECT_EQ(fills[3], "none");
}

TEST(RenderTest, ConditionalDoesNotAddDepth) {
    Conditional top;
    top.condition.group_number = 1;
    top.true_branch = boxed(pattern(capture(1, pattern(literal("a")))));
    const auto top_fills = subexp_fills(diagram_render::render(pattern(fragment(std::move(top)))));
    ASSERT_EQ(top_fills.size(), 1u);
    EXPECT_EQ(top_fills[0], "none");

    Conditional inner;
    inner.condition.group_number = 1;
    inner.true_branch = boxed(pattern(capture(2, pattern(literal("a")))));
    const auto nested_fills = subexp_fills(diagram_render::render(
        pattern(capture(1, pattern(fragment(std::move(inner)))))));
    ASSERT_EQ(nested_fills.size(), 2u);
    EXPECT_EQ(nested_fills[0], "none");
    EXPECT_EQ(nested_fills[1], "#cce5ff");
}

TEST(RenderTest, ScopedModifierDoesNotAddDepth) {
    InlineModifier scoped;
    scoped.enable = "i";
    scoped.regexp = boxed(pattern(capture(1, pattern(literal("a")))));
    const auto fills = subexp_fills(diagram_render::render(pattern(fragment(std::move(scoped)))));
    ASSERT_EQ(fills.size(), 1u);
    EXPECT_EQ(fills[0], "none");
}

TEST(QuantifierTest, ZeroOrMore) {
    Config config;
    auto node = diagram_render::render_fragment(literal("a", repeat(0, -1)), config);
    const std::string out = node.element->to_string();
    EXPECT_NE(out.find("class=\"skip-path\""), std::string::npos);
    EXPECT_NE(out.find("class=\"loop-path\""), std::string::npos);
    EXPECT_EQ(out.find("repeat-label"), std::string::npos);

    // 3 glyphs plus padding, widened by a curve radius on each side.
    EXPECT_NEAR(node.bbox.width, 55.2, 1e-9);
    EXPECT_NEAR(node.bbox.height, 64, 1e-9);
    EXPECT_NEAR(node.bbox.anchor_y, 32, 1e-9);
}

TEST(QuantifierTest, SkipTrackRunsAboveContent) {
    Config config;
    const std::string out = diagram_render::render_fragment(literal("a", repeat(0, -1)), config).element->to_string();
    // Content sits at y=20; the bypass runs halfway into the reserved band.
    EXPECT_NE(out.find("d=\"M 0 32 Q 0 10 10 10 H "), std::string::npos);
    EXPECT_EQ(out.find("Q 0 22 "), std::string::npos);
}

TEST(QuantifierTest, OneOrMore) {
    Config config;
    const std::string out = diagram_render::render_fragment(literal("a", repeat(1, -1)), config).element->to_string();
    EXPECT_EQ(out.find("skip-path"), std::string::npos);
    EXPECT_NE(out.find("class=\"loop-path\""), std::string::npos);
}

TEST(QuantifierTest, Optional) {
    Config config;
    const std::string out = diagram_render::render_fragment(literal("a", repeat(0, 1)), config).element->to_string();
    EXPECT_NE(out.find("class=\"skip-path\""), std::string::npos);
    EXPECT_EQ(out.find("loop-path"), std::string::npos);
    EXPECT_EQ(out.find("loop-arrow"), std::string::npos);
}

TEST(QuantifierTest, ExactCount) {
    Config config;
    const std::string out = diagram_render::render_fragment(literal("a", repeat(3, 3)), config).element->to_string();
    EXPECT_EQ(out.find("skip-path"), std::string::npos);
    EXPECT_NE(out.find("class=\"loop-path\""), std::string::npos);
    EXPECT_NE(out.find(">3 times</text>"), std::string::npos);
}

TEST(QuantifierTest, ExactlyOnceIsPlain) {
    Config config;
    const std::string plain = diagram_render::render_fragment(literal("a"), config).element->to_string();
    const std::string once = diagram_render::render_fragment(literal("a", repeat(1, 1)), config).element->to_string();
    EXPECT_EQ(plain, once);
}

TEST(QuantifierTest, PossessiveOptionalKeepsLabelWithoutLoop) {
    Config config;
    const std::string out = diagram_render::render_fragment(literal("a", repeat(0, 1, true, true)), config)
        .element->to_string();
    EXPECT_EQ(out.find("loop-path"), std::string::npos);
    EXPECT_NE(out.find(">possessive</text>"), std::string::npos);
}

TEST(QuantifierTest, ArrowEncodesGreediness) {
    Config config;
    auto greedy = diagram_render::render_fragment(literal("a", repeat(1, -1)), config);
    auto lazy = diagram_render::render_fragment(literal("a", repeat(1, -1, false)), config);
    const std::string g = greedy.element->to_string();
    const std::string l = lazy.element->to_string();
    EXPECT_NE(g.find("class=\"loop-arrow\""), std::string::npos);
    EXPECT_NE(g, l);

    // Greedy: chevron tail right of its tip. Lazy: left.
    const double mid = greedy.bbox.width / 2;
    EXPECT_NE(g.find("d=\"M " + svg_canvas::format_number(mid + 5)), std::string::npos);
    EXPECT_NE(l.find("d=\"M " + svg_canvas::format_number(mid - 5)), std::string::npos);
}

TEST(AnchorBoundTest, EveryRuleKeepsAnchorInsideBox) {
    Config config;
    expect_anchor_inside(diagram_render::render_regexp(complex_pattern(), config).bbox);
    expect_anchor_inside(diagram_render::render_fragment(literal("a", repeat(0, -1)), config).bbox);
    expect_anchor_inside(diagram_render::render_fragment(literal("a", repeat(2, 2, true, true)), config).bbox);
    expect_anchor_inside(diagram_render::render_fragment(capture(1, Regexp{}), config).bbox);

    Conditional cond;
    cond.true_branch = boxed(alternation(sequence(literal("a")), sequence(literal("b")), sequence(literal("c"))));
    cond.false_branch = boxed(pattern(literal("d")));
    expect_anchor_inside(diagram_render::render_fragment(fragment(std::move(cond)), config).bbox);
}

TEST(NodeRuleTest, Charset) {
    Charset cs;
    cs.inverted = true;
    cs.items.push_back({ CharsetItem::Kind::Range, "a", "z" });
    CharsetItem digit;
    digit.kind = CharsetItem::Kind::Escape;
    digit.escape = { "digit", "d", "digit" };
    cs.items.push_back(digit);

    const std::string out = diagram_render::render_fragment(fragment(std::move(cs)), Config{}).element->to_string();
    EXPECT_NE(out.find("class=\"charset\""), std::string::npos);
    EXPECT_NE(out.find(">None of:</text>"), std::string::npos);
    EXPECT_NE(out.find(">&quot;a&quot; - &quot;z&quot;</text>"), std::string::npos);
    EXPECT_NE(out.find(">digit</text>"), std::string::npos);
}

TEST(NodeRuleTest, Conditional) {
    Conditional cond;
    cond.condition.group_number = 1;
    cond.true_branch = boxed(pattern(literal("a")));
    cond.false_branch = boxed(pattern(literal("b")));

    const std::string out = diagram_render::render_fragment(fragment(std::move(cond)), Config{}).element->to_string();
    EXPECT_NE(out.find("class=\"conditional\""), std::string::npos);
    EXPECT_NE(out.find(">if group 1 matched</text>"), std::string::npos);
    EXPECT_NE(out.find(">then</text>"), std::string::npos);
    EXPECT_NE(out.find(">else</text>"), std::string::npos);
    EXPECT_EQ(count_of(out, "class=\"condition-label\""), 2u);
}

TEST(NodeRuleTest, ConditionalWithoutElse) {
    Conditional cond;
    cond.condition.kind = Condition::Kind::Define;
    cond.true_branch = boxed(pattern(literal("a")));

    const std::string out = diagram_render::render_fragment(fragment(std::move(cond)), Config{}).element->to_string();
    EXPECT_NE(out.find(">DEFINE</text>"), std::string::npos);
    EXPECT_EQ(out.find(">else</text>"), std::string::npos);
}

TEST(NodeRuleTest, InlineModifiers) {
    InlineModifier global;
    global.enable = "i";
    const std::string g = diagram_render::render_fragment(fragment(std::move(global)), Config{}).element->to_string();
    EXPECT_NE(g.find("class=\"flags\""), std::string::npos);
    EXPECT_NE(g.find(">flags: +i</text>"), std::string::npos);

    InlineModifier scoped;
    scoped.disable = "m";
    scoped.regexp = boxed(pattern(literal("x")));
    const std::string s = diagram_render::render_fragment(fragment(std::move(scoped)), Config{}).element->to_string();
    EXPECT_NE(s.find("class=\"flags-label\""), std::string::npos);
    EXPECT_NE(s.find("<tspan>x</tspan>"), std::string::npos);
}

TEST(NodeRuleTest, CommentAndLeaves) {
    Config config;
    const std::string comment = diagram_render::render_fragment(fragment(Comment{ "note" }), config).element->to_string();
    EXPECT_NE(comment.find("class=\"comment\""), std::string::npos);
    EXPECT_NE(comment.find("># note</text>"), std::string::npos);

    const std::string any = diagram_render::render_fragment(fragment(AnyCharacter{}), config).element->to_string();
    EXPECT_NE(any.find(">any character</text>"), std::string::npos);

    const std::string ref = diagram_render::render_fragment(fragment(BackReference{ 2, "" }), config).element->to_string();
    EXPECT_NE(ref.find(">back reference #2</text>"), std::string::npos);

    const std::string verb = diagram_render::render_fragment(fragment(BacktrackControl{ "ACCEPT", "" }), config)
        .element->to_string();
    EXPECT_NE(verb.find("class=\"backtrack-control\""), std::string::npos);
}

TEST(NodeRuleTest, UnknownKindFallsBackToGenericBox) {
    const std::string out = diagram_render::render_fragment(fragment(Unknown{ "future_node" }), Config{})
        .element->to_string();
    EXPECT_NE(out.find("class=\"unknown\""), std::string::npos);
    EXPECT_NE(out.find(">&lt;future_node&gt;</text>"), std::string::npos);

    const std::string svg = diagram_render::render(pattern(fragment(Unknown{ "future_node" }), literal("a")));
    EXPECT_EQ(svg.substr(svg.size() - 6), "</svg>");
}

TEST(ComposerTest, FlagsBoxWidensDocument) {
    Regexp plain = pattern(literal("a"));
    Regexp flagged = pattern(literal("a"));
    flagged.flags = "gi";

    const std::string a = diagram_render::render(plain);
    const std::string b = diagram_render::render(flagged);
    EXPECT_NE(b.find(">Flags:</text>"), std::string::npos);
    EXPECT_NE(b.find(">global</text>"), std::string::npos);
    EXPECT_NE(b.find(">ignore case</text>"), std::string::npos);
    EXPECT_GT(svg_attribute(b, "width"), svg_attribute(a, "width"));
    EXPECT_EQ(a.find("Flags:"), std::string::npos);
}

TEST(ComposerTest, OptionsBannerAddsHeight) {
    Regexp plain = pattern(literal("a"));
    Regexp options = pattern(literal("a"));
    options.options = { { "UTF", "" }, { "LIMIT_MATCH", "10" } };

    const std::string a = diagram_render::render(plain);
    const std::string b = diagram_render::render(options);
    EXPECT_NE(b.find(">Options: *UTF, *LIMIT_MATCH=10</text>"), std::string::npos);
    EXPECT_GT(svg_attribute(b, "height"), svg_attribute(a, "height"));
    EXPECT_GE(svg_attribute(b, "width"), svg_attribute(a, "width"));
}

TEST(ComposerTest, StylesheetFollowsConfig) {
    Config config;
    EXPECT_NE(diagram_render::build_stylesheet(config).find(".literal > rect{fill:#ff6b6b}"), std::string::npos);
    EXPECT_EQ(diagram_render::build_stylesheet(config).find("svg{background"), std::string::npos);

    config.literal_fill = "#123456";
    config.background_color = "#fff";
    const std::string css = diagram_render::build_stylesheet(config);
    EXPECT_NE(css.find(".literal > rect{fill:#123456}"), std::string::npos);
    EXPECT_NE(css.find("svg{background:#fff}"), std::string::npos);

    const std::string svg = diagram_render::render(pattern(literal("a")), config);
    EXPECT_NE(svg.find(".literal &gt; rect{fill:#123456}"), std::string::npos);
}
