#pragma once

#include <diagram_layout/types.hpp>
#include <diagram_render/config.hpp>
#include <string>
#include <vector>

namespace diagram_render {

// Rounded box sized to fit text (one <text> per '\n'-separated line), centered.
diagram_layout::RenderedNode label_box(const std::string& text, const std::string& css_class,
    const Config& config);

// Box whose text is wrapped in quote glyphs drawn as separate spans.
diagram_layout::RenderedNode quoted_box(const std::string& text, const std::string& css_class,
    const Config& config);

// Heading line plus one centered line per item; grows with the item count.
diagram_layout::RenderedNode list_box(const std::string& heading, const std::vector<std::string>& items,
    const std::string& css_class, const Config& config);

// Dashed, smaller-text box for inline comments.
diagram_layout::RenderedNode comment_box(const std::string& text, const Config& config);

// Banner listing pattern-start options.
diagram_layout::RenderedNode banner_box(const std::string& text, const Config& config);

// Box with a title line above rendered content. Empty fill/stroke leave the
// rect to the stylesheet. Stub lines join the box edges to the content anchors.
diagram_layout::RenderedNode titled_box(const std::string& title, diagram_layout::RenderedNode content,
    const std::string& css_class, const std::string& fill, const std::string& stroke,
    const Config& config);

// Empty group with a zero box.
diagram_layout::RenderedNode empty_node();

} // namespace diagram_render
