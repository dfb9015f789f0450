#pragma once

#include "osim/rules/outfit_rule.h"

namespace osim::rules {

// forbidden_color_combo: complementary families (red/green, blue/orange-yellow,
// yellow/purple) must not appear together. Any clash scores 50 with severity error.
class ForbiddenColorComboRule final : public ColorRule {
 public:
  static constexpr double kDefaultWeight = 1.8;

  explicit ForbiddenColorComboRule(double weight = kDefaultWeight);

 protected:
  [[nodiscard]] RuleResult evaluate_colors(const std::vector<ColorSpec>& colors,
                                           const OutfitRecord& outfit) const override;
};

}  // namespace osim::rules
