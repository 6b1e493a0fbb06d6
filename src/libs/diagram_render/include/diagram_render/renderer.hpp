#pragma once

#include <diagram_layout/types.hpp>
#include <diagram_render/config.hpp>
#include <regex_model/ast.hpp>
#include <string>

namespace diagram_render {

// Renders the tree to a complete <svg> document. Total: every node kind maps
// to some drawable box, so this never fails. Pure function of its inputs;
// equal inputs give byte-identical output.
std::string render(const regex_model::Regexp& ast, const Config& config = {});

// Lays out one Regexp without the document chrome. depth is the group
// nesting depth of the caller (0 at the root).
diagram_layout::RenderedNode render_regexp(const regex_model::Regexp& regexp,
    const Config& config, int depth = 0);

// Lays out a single fragment (content plus optional quantifier).
diagram_layout::RenderedNode render_fragment(const regex_model::MatchFragment& fragment,
    const Config& config, int depth = 0);

// The <style> rules embedded in every document.
std::string build_stylesheet(const Config& config);

} // namespace diagram_render
