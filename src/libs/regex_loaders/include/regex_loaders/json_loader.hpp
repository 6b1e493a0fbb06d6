#pragma once

#include <diagram_render/config.hpp>
#include <regex_loaders/parse_failure.hpp>
#include <regex_model/ast.hpp>
#include <istream>
#include <optional>
#include <string>

namespace regex_loaders {

// Output of a flavor parser: either an AST or a parse failure.
struct RegexDocument {
    std::string pattern;
    std::string flavor;
    std::optional<regex_model::Regexp> ast;
    std::optional<ParseFailure> error;
};

std::optional<RegexDocument> load_regex_document_from_json(std::istream& in);
std::optional<RegexDocument> load_regex_document_from_json_file(const std::string& path);

// Overlays the keys present in the JSON object on base.
std::optional<diagram_render::Config> load_config_from_json(std::istream& in,
    diagram_render::Config base = {});
std::optional<diagram_render::Config> load_config_from_json_file(const std::string& path,
    diagram_render::Config base = {});

} // namespace regex_loaders
