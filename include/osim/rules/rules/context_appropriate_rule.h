#pragma once

#include "osim/garment/style_taxonomy.h"
#include "osim/rules/outfit_rule.h"

#include <string_view>
#include <vector>

namespace osim::rules {

// context_appropriate: the outfit should contain at least one piece in a style
// category recommended for context["type"]. Unknown or missing types pass.
class ContextAppropriateRule final : public ContextRule {
 public:
  static constexpr double kDefaultWeight = 1.3;

  explicit ContextAppropriateRule(double weight = kDefaultWeight);

  // Recommended categories for a context type; empty for unmapped types.
  [[nodiscard]] static std::vector<garment::StyleCategory> recommended_categories(
      std::string_view context_type);

 protected:
  [[nodiscard]] RuleResult evaluate_context(const ContextMap& context,
                                            const OutfitRecord& outfit) const override;
};

}  // namespace osim::rules
