#include "osim/rules/rules/three_color_rule.h"

#include <algorithm>
#include <string>
#include <utility>

namespace osim::rules {

namespace {

bool is_neutral_name(const std::string& name) {
  return name == "black" || name == "white" || name == "gray";
}

}  // namespace

ThreeColorRule::ThreeColorRule(std::size_t max_colors, double weight)
    : ColorRule("three_color",
                "Keep the outfit to at most " + std::to_string(max_colors) + " main colors",
                weight),
      max_colors_(max_colors) {}

RuleResult ThreeColorRule::evaluate_colors(const std::vector<ColorSpec>& colors,
                                           const OutfitRecord& /*outfit*/) const {
  std::vector<std::string> main_colors;
  for (const auto& spec : colors) {
    auto name = color_spec_name(spec);
    if (is_neutral_name(name)) {
      continue;
    }
    if (std::find(main_colors.begin(), main_colors.end(), name) == main_colors.end()) {
      main_colors.push_back(std::move(name));
    }
  }

  const std::size_t count = main_colors.size();
  RuleResult result;
  if (count <= max_colors_) {
    result.passed = true;
    result.score = 100.0;
    result.message =
        "Follows the three-color principle with " + std::to_string(count) + " main colors";
    result.severity = Severity::kInfo;
    return result;
  }

  const auto excess = static_cast<double>(count - max_colors_);
  result.passed = false;
  result.score = std::max(0.0, 100.0 - excess * 20.0);
  result.message = "Violates the three-color principle: " + std::to_string(count) +
                   " main colors (at most " + std::to_string(max_colors_) + " recommended)";
  result.suggestion = "Keep " + std::to_string(max_colors_) +
                      " main colors and use neutrals (black/white/gray) for the rest";
  result.severity = Severity::kWarning;
  return result;
}

}  // namespace osim::rules
