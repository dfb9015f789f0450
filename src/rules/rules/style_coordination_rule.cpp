#include "osim/rules/rules/style_coordination_rule.h"

#include <algorithm>
#include <array>
#include <string_view>
#include <utility>

namespace osim::rules {

namespace {

constexpr std::array<std::string_view, 3> kSlots = {"top", "bottom", "shoes"};

std::string_view label_in(const StyleMap& styles, std::string_view slot) {
  const auto it = styles.find(std::string(slot));
  return it == styles.end() ? std::string_view{} : std::string_view{it->second};
}

}  // namespace

StyleCoordinationRule::StyleCoordinationRule(double weight)
    : StyleCoordinationRule(garment::default_style_taxonomy(), weight) {}

StyleCoordinationRule::StyleCoordinationRule(garment::StyleTaxonomy taxonomy, double weight)
    : StyleRule("style_coordination", "Top, bottom and shoes should share one style", weight),
      taxonomy_(std::move(taxonomy)) {}

RuleResult StyleCoordinationRule::evaluate_styles(const StyleMap& styles,
                                                  const OutfitRecord& /*outfit*/) const {
  std::vector<std::string_view> categories;
  for (const auto slot : kSlots) {
    const auto category = taxonomy_.category_of(label_in(styles, slot));
    if (category == "unknown") {
      continue;
    }
    if (std::find(categories.begin(), categories.end(), category) == categories.end()) {
      categories.push_back(category);
    }
  }

  if (categories.empty()) {
    return skipped_result("Cannot determine the outfit style");
  }

  RuleResult result;
  if (categories.size() == 1) {
    result.passed = true;
    result.score = 100.0;
    result.message = "Styles are consistent";
    result.severity = Severity::kInfo;
  } else if (categories.size() == 2) {
    result.passed = true;
    result.score = 70.0;
    result.message = "Styles are partly mixed but broadly coordinated";
    result.suggestion = "Settle on one style for a cleaner look";
    result.severity = Severity::kWarning;
  } else {
    result.passed = false;
    result.score = 40.0;
    result.message = "Styles clash across the outfit";
    result.suggestion = "Keep to one style: formal with formal, casual with casual";
    result.severity = Severity::kError;
  }
  return result;
}

}  // namespace osim::rules
