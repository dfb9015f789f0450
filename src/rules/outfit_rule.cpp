#include "osim/rules/outfit_rule.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace osim::rules {

namespace {

void require_positive_weight(const std::string& rule_name, double weight) {
  if (!(weight > 0.0)) {
    throw std::invalid_argument("rule '" + rule_name + "' weight must be positive, got " +
                                std::to_string(weight));
  }
}

}  // namespace

OutfitRule::OutfitRule(std::string name, std::string description, double weight)
    : name_(std::move(name)), description_(std::move(description)), weight_(weight) {
  require_positive_weight(name_, weight_);
}

void OutfitRule::set_weight(double weight) {
  require_positive_weight(name_, weight);
  weight_ = weight;
}

RuleResult OutfitRule::evaluate(const OutfitRecord& outfit) const {
  RuleResult result = do_evaluate(outfit);
  result.score = std::clamp(result.score, 0.0, 100.0);
  result.weight = weight_;
  return result;
}

RuleResult skipped_result(std::string message) {
  RuleResult result;
  result.passed = true;
  result.score = 100.0;
  result.message = std::move(message);
  result.severity = Severity::kInfo;
  return result;
}

RuleResult ColorRule::do_evaluate(const OutfitRecord& outfit) const {
  if (outfit.colors.empty()) {
    return skipped_result("No colors provided; color rule skipped");
  }
  return evaluate_colors(outfit.colors, outfit);
}

RuleResult StyleRule::do_evaluate(const OutfitRecord& outfit) const {
  if (outfit.styles.empty()) {
    return skipped_result("No styles provided; style rule skipped");
  }
  return evaluate_styles(outfit.styles, outfit);
}

RuleResult ContextRule::do_evaluate(const OutfitRecord& outfit) const {
  if (outfit.context.empty()) {
    return skipped_result("No context provided; context rule skipped");
  }
  return evaluate_context(outfit.context, outfit);
}

}  // namespace osim::rules
