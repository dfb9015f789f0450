#include "osim/rules/rules/context_appropriate_rule.h"

#include <algorithm>
#include <array>
#include <string>

namespace osim::rules {

namespace {

using garment::StyleCategory;

struct ContextEntry {
  std::string_view type;
  std::array<StyleCategory, 2> categories;
  std::size_t count;
};

constexpr std::array<ContextEntry, 6> kContextStyles = {{
    {"formal occasion", {StyleCategory::kFormal}, 1},
    {"business", {StyleCategory::kFormal}, 1},
    {"work", {StyleCategory::kFormal, StyleCategory::kCasual}, 2},
    {"casual", {StyleCategory::kCasual}, 1},
    {"sport", {StyleCategory::kCasual}, 1},
    {"party", {StyleCategory::kCasual, StyleCategory::kFormal}, 2},
}};

constexpr std::array<std::string_view, 3> kSlots = {"top", "bottom", "shoes"};

}  // namespace

ContextAppropriateRule::ContextAppropriateRule(double weight)
    : ContextRule("context_appropriate", "Outfit style should suit the occasion", weight) {}

std::vector<StyleCategory> ContextAppropriateRule::recommended_categories(
    std::string_view context_type) {
  for (const auto& entry : kContextStyles) {
    if (entry.type == context_type) {
      return {entry.categories.begin(), entry.categories.begin() + entry.count};
    }
  }
  return {};
}

RuleResult ContextAppropriateRule::evaluate_context(const ContextMap& context,
                                                    const OutfitRecord& outfit) const {
  const auto type_it = context.find("type");
  if (type_it == context.end() || type_it->second.empty()) {
    return skipped_result("No context type specified");
  }
  const std::string& type = type_it->second;

  const auto recommended = recommended_categories(type);
  if (recommended.empty()) {
    return skipped_result("Context '" + type + "' has no specific style requirement");
  }

  const auto is_recommended = [&](StyleCategory c) {
    return std::find(recommended.begin(), recommended.end(), c) != recommended.end();
  };

  bool satisfied = false;
  for (const auto slot : kSlots) {
    const auto it = outfit.styles.find(std::string(slot));
    if (it == outfit.styles.end()) {
      continue;
    }
    const auto category = garment::style_category_of(it->second);
    if (category != StyleCategory::kUnknown && is_recommended(category)) {
      satisfied = true;
      break;
    }
  }

  RuleResult result;
  if (satisfied) {
    result.passed = true;
    result.score = 100.0;
    result.message = "Outfit style suits the '" + type + "' context";
    result.severity = Severity::kInfo;
    return result;
  }

  result.passed = false;
  result.score = 60.0;
  result.severity = Severity::kWarning;
  if (is_recommended(StyleCategory::kFormal)) {
    result.message = "The '" + type + "' context calls for formal wear; the outfit is too casual";
    result.suggestion = "Choose formal pieces such as a shirt, coat or leather shoes";
  } else {
    result.message = "The '" + type + "' context calls for casual wear; the outfit is too formal";
    result.suggestion = "Choose casual pieces such as a t-shirt, jeans or sneakers";
  }
  return result;
}

}  // namespace osim::rules
