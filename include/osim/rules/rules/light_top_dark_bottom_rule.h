#pragma once

#include "osim/rules/outfit_rule.h"

namespace osim::rules {

// light_top_dark_bottom: the average brightness of the top colors should be at
// least that of the bottom colors. Penalty is half the brightness gap.
class LightTopDarkBottomRule final : public ColorRule {
 public:
  static constexpr double kDefaultWeight = 1.2;

  explicit LightTopDarkBottomRule(double weight = kDefaultWeight);

 protected:
  [[nodiscard]] RuleResult evaluate_colors(const std::vector<ColorSpec>& colors,
                                           const OutfitRecord& outfit) const override;
};

}  // namespace osim::rules
