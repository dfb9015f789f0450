#pragma once

#include "osim/rules/evaluation_report.h"
#include "osim/rules/outfit_record.h"
#include "osim/rules/rule_library.h"

#include <memory>
#include <optional>
#include <string_view>

namespace osim::rules {

// RuleEvaluator runs the enabled rules of a caller-owned library against one
// outfit. The library must outlive the evaluator.
//
// evaluate_outfit() does not modify the library. Exceptions thrown by a rule
// propagate and abort the evaluation; no partial report is produced.
class RuleEvaluator {
 public:
  explicit RuleEvaluator(RuleLibrary& library);

  [[nodiscard]] EvaluationReport evaluate_outfit(const OutfitInput& input) const;
  [[nodiscard]] EvaluationReport evaluate_record(const OutfitRecord& record) const;

  // Registers a rule in the underlying library. False on null or duplicate name.
  [[nodiscard]] bool add_custom_rule(std::unique_ptr<OutfitRule> rule);

  // Forwards to RuleLibrary::configure.
  bool configure_rule(std::string_view name, std::optional<double> weight,
                      std::optional<bool> enabled);

  [[nodiscard]] const RuleLibrary& library() const noexcept { return library_; }

 private:
  RuleLibrary& library_;
};

}  // namespace osim::rules
