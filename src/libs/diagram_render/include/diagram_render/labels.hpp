#pragma once

#include <regex_model/ast.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace diagram_render {

// Flavor-independent, human-readable text for AST nodes.

std::string anchor_label(const regex_model::Anchor& anchor);
std::string group_title(const regex_model::Subexp& subexp);
std::string balanced_group_title(const regex_model::BalancedGroup& group);
std::string back_reference_label(const regex_model::BackReference& ref);
std::string unicode_property_label(const regex_model::UnicodePropertyEscape& escape);
std::string posix_class_label(regex_model::PosixClassName name, const std::string& raw_name, bool negated);
std::string charset_item_label(const regex_model::CharsetItem& item);
std::string condition_label(const regex_model::Condition& condition);
std::string recursive_ref_label(const regex_model::RecursiveRef& ref);
std::string backtrack_control_label(const regex_model::BacktrackControl& control);
std::string callout_label(const regex_model::Callout& callout);
std::string modifier_label(const regex_model::InlineModifier& modifier);

// "N times", "N+ times", "N to M times", with possessive marking. Empty for
// the implicit shapes (*, +, ?, {1}) unless possessive.
std::string repeat_label(const regex_model::Repeat& repeat);

// One description per flag letter, in input order.
std::vector<std::string> flag_descriptions(std::string_view flags);

// "Options: *UTF, *LIMIT_MATCH=10"
std::string pattern_options_label(const std::vector<regex_model::PatternOption>& options);

} // namespace diagram_render
