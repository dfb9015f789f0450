#pragma once

#include "osim/garment/style_taxonomy.h"
#include "osim/rules/outfit_rule.h"

namespace osim::rules {

// style_coordination: the top, bottom and shoes labels should share one style
// category. Labels the taxonomy does not know are ignored.
//   one category         -> 100, info
//   two categories       -> 70, warning, still passed
//   three or more        -> 40, error, not passed (needs an extended taxonomy)
class StyleCoordinationRule final : public StyleRule {
 public:
  static constexpr double kDefaultWeight = 1.5;

  explicit StyleCoordinationRule(double weight = kDefaultWeight);
  StyleCoordinationRule(garment::StyleTaxonomy taxonomy, double weight);

 protected:
  [[nodiscard]] RuleResult evaluate_styles(const StyleMap& styles,
                                           const OutfitRecord& outfit) const override;

 private:
  garment::StyleTaxonomy taxonomy_;
};

}  // namespace osim::rules
