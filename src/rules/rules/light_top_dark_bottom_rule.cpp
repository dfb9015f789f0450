#include "osim/rules/rules/light_top_dark_bottom_rule.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace osim::rules {

namespace {

double average_brightness(const std::vector<ColorSpec>& colors) {
  double sum = 0.0;
  for (const auto& spec : colors) {
    sum += color_spec_brightness(spec);
  }
  return sum / static_cast<double>(colors.size());
}

}  // namespace

LightTopDarkBottomRule::LightTopDarkBottomRule(double weight)
    : ColorRule("light_top_dark_bottom", "Tops should be lighter than bottoms", weight) {}

RuleResult LightTopDarkBottomRule::evaluate_colors(const std::vector<ColorSpec>& /*colors*/,
                                                   const OutfitRecord& outfit) const {
  if (outfit.top_colors.empty() || outfit.bottom_colors.empty()) {
    return skipped_result("No top or bottom colors provided; check skipped");
  }

  const double top = average_brightness(outfit.top_colors);
  const double bottom = average_brightness(outfit.bottom_colors);

  RuleResult result;
  if (top >= bottom) {
    result.passed = true;
    result.score = 100.0;
    result.message = "Follows the light-top, dark-bottom principle";
    result.severity = Severity::kInfo;
    return result;
  }

  std::ostringstream message;
  message << std::fixed << std::setprecision(1)
          << "Violates the light-top, dark-bottom principle (top brightness: " << top
          << ", bottom brightness: " << bottom << ")";

  result.passed = false;
  result.score = std::max(0.0, 100.0 - (bottom - top) / 2.0);
  result.message = message.str();
  result.suggestion = "Choose a lighter top or a darker bottom";
  result.severity = Severity::kWarning;
  return result;
}

}  // namespace osim::rules
