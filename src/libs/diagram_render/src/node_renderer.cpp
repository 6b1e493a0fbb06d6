#include <diagram_render/renderer.hpp>
#include <diagram_render/labels.hpp>
#include <diagram_layout/connectors.hpp>
#include <diagram_layout/layout_constants.hpp>
#include <diagram_layout/spacing.hpp>
#include <spdlog/spdlog.h>
#include "boxes.hpp"
#include <algorithm>
#include <memory>
#include <variant>

namespace diagram_render {

namespace {

using namespace diagram_layout::layout;
using diagram_layout::BoundingBox;
using diagram_layout::RenderedNode;
using regex_model::Regexp;

// Per-call state threaded through the recursion. depth only picks group fills.
struct RenderContext {
    const Config& config;
    int depth;

    RenderContext nested() const { return { config, depth + 1 }; }
};

RenderedNode render_regexp_node(const Regexp* regexp, const RenderContext& ctx);
RenderedNode render_fragment_node(const regex_model::MatchFragment& fragment, const RenderContext& ctx);

std::unique_ptr<svg_canvas::Path> stroke_path(std::string d, const Config& config, std::string css_class = {}) {
    auto path = std::make_unique<svg_canvas::Path>();
    path->d = std::move(d);
    path->stroke = config.line_color;
    path->stroke_width = config.line_width;
    path->css_class = std::move(css_class);
    return path;
}

std::unique_ptr<svg_canvas::Line> stub_line(double x1, double x2, double y, const Config& config) {
    auto line = std::make_unique<svg_canvas::Line>();
    line->x1 = x1;
    line->y1 = y;
    line->x2 = x2;
    line->y2 = y;
    line->stroke = config.line_color;
    line->stroke_width = config.line_width;
    return line;
}

// Group rule: nested content one level deeper, box filled for this depth.
RenderedNode render_group(const std::string& title, const Regexp* regexp, const RenderContext& ctx) {
    RenderedNode content = render_regexp_node(regexp, ctx.nested());
    return titled_box(title, std::move(content), "subexp",
        subexp_fill_for_depth(ctx.config, ctx.depth), ctx.config.subexp_stroke, ctx.config);
}

// "then"/"else" label followed by the branch content.
RenderedNode render_condition_branch(const char* label, const Regexp* branch, const RenderContext& ctx) {
    std::vector<RenderedNode> items;
    items.push_back(label_box(label, "condition-label", ctx.config));
    items.push_back(render_regexp_node(branch, ctx));
    diagram_layout::SpacedNodes spaced = diagram_layout::space_horizontally(std::move(items), ctx.config.horizontal_gap);

    const double anchor_y = spaced.bbox.anchor_y;
    auto group = std::make_unique<svg_canvas::Group>();
    group->add(stroke_path(diagram_layout::sequence_path(spaced.items, anchor_y), ctx.config));
    for (auto& item : spaced.items)
        group->add(std::move(item.element));
    return { std::move(group), spaced.bbox };
}

struct ContentRenderer {
    const RenderContext& ctx;

    RenderedNode operator()(const regex_model::Literal& n) const {
        return quoted_box(n.text, "literal", ctx.config);
    }

    RenderedNode operator()(const regex_model::QuotedLiteral& n) const {
        return quoted_box(n.text, "literal", ctx.config);
    }

    RenderedNode operator()(const regex_model::AnyCharacter&) const {
        return label_box("any character", "any-character", ctx.config);
    }

    RenderedNode operator()(const regex_model::Anchor& n) const {
        return label_box(anchor_label(n), "anchor", ctx.config);
    }

    RenderedNode operator()(const regex_model::Escape& n) const {
        return label_box(n.value, "escape", ctx.config);
    }

    RenderedNode operator()(const regex_model::BackReference& n) const {
        return label_box(back_reference_label(n), "escape", ctx.config);
    }

    RenderedNode operator()(const regex_model::UnicodePropertyEscape& n) const {
        return label_box(unicode_property_label(n), "escape", ctx.config);
    }

    RenderedNode operator()(const regex_model::Charset& n) const {
        std::vector<std::string> lines;
        lines.reserve(n.items.size());
        for (const auto& item : n.items)
            lines.push_back(charset_item_label(item));
        return list_box(n.inverted ? "None of:" : "One of:", lines, "charset", ctx.config);
    }

    RenderedNode operator()(const regex_model::Subexp& n) const {
        return render_group(group_title(n), n.regexp.get(), ctx);
    }

    RenderedNode operator()(const regex_model::BranchReset& n) const {
        return render_group("branch reset", n.regexp.get(), ctx);
    }

    RenderedNode operator()(const regex_model::BalancedGroup& n) const {
        return render_group(balanced_group_title(n), n.regexp.get(), ctx);
    }

    RenderedNode operator()(const regex_model::Conditional& n) const {
        const Config& cfg = ctx.config;
        RenderedNode yes = render_condition_branch("then", n.true_branch.get(), ctx);

        if (!n.false_branch) {
            return titled_box(condition_label(n.condition), std::move(yes), "conditional", "", "", cfg);
        }

        RenderedNode no = render_condition_branch("else", n.false_branch.get(), ctx);

        const double width = std::max(yes.bbox.width, no.bbox.width);
        const double yes_dx = (width - yes.bbox.width) / 2 - yes.bbox.x;
        const double yes_dy = -yes.bbox.y;
        const double no_dx = (width - no.bbox.width) / 2 - no.bbox.x;
        const double no_dy = yes.bbox.height + cfg.vertical_gap - no.bbox.y;

        const BoundingBox yes_box = yes.bbox.translated(yes_dx, yes_dy);
        const BoundingBox no_box = no.bbox.translated(no_dx, no_dy);

        auto yes_group = std::make_unique<svg_canvas::Group>("condition-yes");
        yes_group->translate_x = yes_dx;
        yes_group->translate_y = yes_dy;
        yes_group->add(std::move(yes.element));

        auto no_group = std::make_unique<svg_canvas::Group>("condition-no");
        no_group->translate_x = no_dx;
        no_group->translate_y = no_dy;
        no_group->add(std::move(no.element));

        auto content = std::make_unique<svg_canvas::Group>();
        content->add(std::move(yes_group));
        content->add(std::move(no_group));

        // The "then" track carries the connector through the box.
        BoundingBox bbox = diagram_layout::make_box(0, 0, width, no_box.y2());
        bbox.anchor_left = yes_box.anchor_left;
        bbox.anchor_right = yes_box.anchor_right;
        bbox.anchor_y = yes_box.anchor_y;

        return titled_box(condition_label(n.condition), { std::move(content), bbox }, "conditional", "", "", cfg);
    }

    RenderedNode operator()(const regex_model::InlineModifier& n) const {
        if (n.regexp)
            return titled_box(modifier_label(n), render_regexp_node(n.regexp.get(), ctx), "flags", "", "", ctx.config);
        return label_box(modifier_label(n), "flags", ctx.config);
    }

    RenderedNode operator()(const regex_model::RecursiveRef& n) const {
        return label_box(recursive_ref_label(n), "recursive-ref", ctx.config);
    }

    RenderedNode operator()(const regex_model::BacktrackControl& n) const {
        return label_box(backtrack_control_label(n), "backtrack-control", ctx.config);
    }

    RenderedNode operator()(const regex_model::Callout& n) const {
        return label_box(callout_label(n), "callout", ctx.config);
    }

    RenderedNode operator()(const regex_model::Comment& n) const {
        return comment_box(n.text, ctx.config);
    }

    RenderedNode operator()(const regex_model::Unknown& n) const {
        spdlog::debug("no layout rule for node kind '{}', drawing a generic box", n.kind);
        return label_box("<" + n.kind + ">", "unknown", ctx.config);
    }
};

// Quantifier rule: skip track above (min == 0), loop track below (max != 1).
RenderedNode render_with_repeat(RenderedNode content, const regex_model::Repeat& repeat, const Config& config) {
    const bool has_skip = repeat.min == 0;
    const bool has_loop = repeat.max != 1;
    const std::string label = repeat_label(repeat);
    if (!has_skip && !has_loop && label.empty()) return content;

    const double offset_x = curve_radius;
    const double offset_y = has_skip ? skip_height : 0.0;
    const double dx = offset_x - content.bbox.x;
    const double dy = offset_y - content.bbox.y;
    const BoundingBox placed = content.bbox.translated(dx, dy);

    const double width = content.bbox.width + 2 * curve_radius;
    double height = content.bbox.height + offset_y + (has_loop ? loop_height : 0.0);
    const double anchor_y = placed.anchor_y;

    auto group = std::make_unique<svg_canvas::Group>("repeat");

    if (has_skip) {
        const double skip_y = placed.y - skip_height / 2;
        group->add(stroke_path(diagram_layout::skip_path(width, anchor_y, skip_y), config, "skip-path"));
    }

    const double below_content = placed.y2();
    double label_y = below_content + config.font_size;
    if (has_loop) {
        const double loop_y = below_content + curve_radius;
        group->add(stroke_path(diagram_layout::loop_path(width, anchor_y, loop_y), config, "loop-path"));
        group->add(stroke_path(diagram_layout::loop_arrow_path(width / 2, loop_y, repeat.greedy), config, "loop-arrow"));
        label_y = loop_y + config.font_size;
    }

    if (!label.empty()) {
        auto text = std::make_unique<svg_canvas::Text>();
        text->x = width / 2;
        text->y = label_y;
        text->content = label;
        text->font_family = config.font_family;
        text->font_size = config.font_size - 2;
        text->anchor = "middle";
        text->css_class = "repeat-label";
        group->add(std::move(text));
        height += config.font_size;
    }

    group->add(diagram_layout::translate_element(std::move(content.element), dx, dy));
    group->add(stub_line(0, placed.anchor_left, anchor_y, config));
    group->add(stub_line(placed.anchor_right, width, anchor_y, config));

    BoundingBox bbox = diagram_layout::make_box(0, 0, width, height);
    bbox.anchor_y = anchor_y;
    return { std::move(group), bbox };
}

RenderedNode render_fragment_node(const regex_model::MatchFragment& fragment, const RenderContext& ctx) {
    RenderedNode content = std::visit(ContentRenderer{ ctx }, fragment.content);
    if (!fragment.repeat) return content;
    return render_with_repeat(std::move(content), *fragment.repeat, ctx.config);
}

// Concatenation: fragments left to right on one connector line.
RenderedNode render_match(const regex_model::Match& match, const RenderContext& ctx) {
    if (match.fragments.empty()) return empty_node();

    std::vector<RenderedNode> items;
    items.reserve(match.fragments.size());
    for (const auto& fragment : match.fragments)
        items.push_back(render_fragment_node(fragment, ctx));

    diagram_layout::SpacedNodes spaced = diagram_layout::space_horizontally(std::move(items), ctx.config.horizontal_gap);

    auto group = std::make_unique<svg_canvas::Group>("match");
    if (spaced.items.size() > 1)
        group->add(stroke_path(diagram_layout::sequence_path(spaced.items, spaced.bbox.anchor_y), ctx.config));
    for (auto& item : spaced.items)
        group->add(std::move(item.element));

    return { std::move(group), spaced.bbox };
}

// Alternation: branches stacked vertically, each with an entry and exit curve.
RenderedNode render_regexp_node(const Regexp* regexp, const RenderContext& ctx) {
    if (!regexp || regexp->matches.empty()) return empty_node();
    if (regexp->matches.size() == 1) return render_match(regexp->matches.front(), ctx);

    std::vector<RenderedNode> items;
    items.reserve(regexp->matches.size());
    for (const auto& match : regexp->matches)
        items.push_back(render_match(match, ctx));

    diagram_layout::SpacedNodes spaced = diagram_layout::space_vertically(std::move(items), ctx.config.vertical_gap * 2);

    const double width = spaced.bbox.width + 2 * connector_width;
    const double height = spaced.bbox.height;
    const double trunk_y = spaced.bbox.anchor_y;

    auto group = std::make_unique<svg_canvas::Group>("regexp");
    auto branches = std::make_unique<svg_canvas::Group>();
    branches->translate_x = connector_width;

    for (auto& item : spaced.items) {
        const BoundingBox& b = item.bbox;
        group->add(stroke_path(diagram_layout::branch_entry_path(trunk_y, b.anchor_y, connector_width + b.anchor_left), ctx.config));
        group->add(stroke_path(diagram_layout::branch_exit_path(width, trunk_y, b.anchor_y, connector_width + b.anchor_right), ctx.config));
        branches->add(std::move(item.element));
    }
    group->add(std::move(branches));

    BoundingBox bbox = diagram_layout::make_box(0, 0, width, height);
    bbox.anchor_y = trunk_y;
    return { std::move(group), bbox };
}

} // namespace

RenderedNode render_regexp(const Regexp& regexp, const Config& config, int depth) {
    return render_regexp_node(&regexp, RenderContext{ config, depth });
}

RenderedNode render_fragment(const regex_model::MatchFragment& fragment, const Config& config, int depth) {
    return render_fragment_node(fragment, RenderContext{ config, depth });
}

} // namespace diagram_render
