#pragma once

#include "osim/rules/outfit_record.h"
#include "osim/rules/rule_result.h"

#include <string>
#include <vector>

namespace osim::rules {

// OutfitRule is the abstract base class for all scoring rules.
//
// evaluate() is non-virtual: it runs the subclass logic in do_evaluate(), then
// clamps the score to [0, 100] and stamps the rule's current weight on the
// result. Subclasses never need to set RuleResult::weight themselves.
//
// Invariant: weight() > 0. The constructor and set_weight() throw
// std::invalid_argument on a non-positive weight.
class OutfitRule {
 public:
  virtual ~OutfitRule() = default;

  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  [[nodiscard]] const std::string& description() const noexcept { return description_; }
  [[nodiscard]] double weight() const noexcept { return weight_; }
  [[nodiscard]] bool enabled() const noexcept { return enabled_; }

  void set_weight(double weight);
  void set_enabled(bool enabled) noexcept { enabled_ = enabled; }

  [[nodiscard]] RuleResult evaluate(const OutfitRecord& outfit) const;

 protected:
  OutfitRule(std::string name, std::string description, double weight);
  OutfitRule(const OutfitRule&) = default;
  OutfitRule& operator=(const OutfitRule&) = default;
  OutfitRule(OutfitRule&&) = default;
  OutfitRule& operator=(OutfitRule&&) = default;

  [[nodiscard]] virtual RuleResult do_evaluate(const OutfitRecord& outfit) const = 0;

 private:
  std::string name_;
  std::string description_;
  double weight_;
  bool enabled_{true};
};

// Rules over OutfitRecord::colors. An empty color list passes with score 100.
class ColorRule : public OutfitRule {
 protected:
  using OutfitRule::OutfitRule;

  [[nodiscard]] RuleResult do_evaluate(const OutfitRecord& outfit) const final;
  [[nodiscard]] virtual RuleResult evaluate_colors(const std::vector<ColorSpec>& colors,
                                                   const OutfitRecord& outfit) const = 0;
};

// Rules over OutfitRecord::styles. An empty style map passes with score 100.
class StyleRule : public OutfitRule {
 protected:
  using OutfitRule::OutfitRule;

  [[nodiscard]] RuleResult do_evaluate(const OutfitRecord& outfit) const final;
  [[nodiscard]] virtual RuleResult evaluate_styles(const StyleMap& styles,
                                                   const OutfitRecord& outfit) const = 0;
};

// Rules over OutfitRecord::context. An empty context passes with score 100.
class ContextRule : public OutfitRule {
 protected:
  using OutfitRule::OutfitRule;

  [[nodiscard]] RuleResult do_evaluate(const OutfitRecord& outfit) const final;
  [[nodiscard]] virtual RuleResult evaluate_context(const ContextMap& context,
                                                    const OutfitRecord& outfit) const = 0;
};

// Passing, neutral result used when a rule has nothing to check.
[[nodiscard]] RuleResult skipped_result(std::string message);

}  // namespace osim::rules
