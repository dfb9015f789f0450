#pragma once

#include "osim/rules/outfit_rule.h"

#include <cstddef>

namespace osim::rules {

// three_color: at most `max_colors` distinct non-neutral color names.
// Each extra main color costs 20 points (warning, not passed).
class ThreeColorRule final : public ColorRule {
 public:
  static constexpr double kDefaultWeight = 1.5;

  explicit ThreeColorRule(std::size_t max_colors = 3, double weight = kDefaultWeight);

  [[nodiscard]] std::size_t max_colors() const noexcept { return max_colors_; }

 protected:
  [[nodiscard]] RuleResult evaluate_colors(const std::vector<ColorSpec>& colors,
                                           const OutfitRecord& outfit) const override;

 private:
  std::size_t max_colors_;
};

}  // namespace osim::rules
