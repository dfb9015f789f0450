#include "osim/rules/rule_evaluator.h"

#include <cmath>
#include <utility>

namespace osim::rules {

namespace {

double round_to_hundredth(double value) {
  return std::round(value * 100.0) / 100.0;
}

}  // namespace

RuleEvaluator::RuleEvaluator(RuleLibrary& library) : library_(library) {}

EvaluationReport RuleEvaluator::evaluate_outfit(const OutfitInput& input) const {
  return evaluate_record(make_outfit_record(input));
}

EvaluationReport RuleEvaluator::evaluate_record(const OutfitRecord& record) const {
  EvaluationReport report;
  double weighted_sum = 0.0;
  double total_weight = 0.0;

  for (const auto* rule : library_.get_enabled()) {
    auto result = rule->evaluate(record);

    weighted_sum += result.score * result.weight;
    total_weight += result.weight;

    report.results.push_back(RuleOutcome{rule->name(), rule->description(), result.passed,
                                         result.score, std::move(result.message),
                                         std::move(result.suggestion), result.severity,
                                         result.weight});
  }

  report.score = total_weight > 0.0 ? round_to_hundredth(weighted_sum / total_weight) : 0.0;

  for (const auto& outcome : report.results) {
    if (outcome.suggestion.has_value() && !outcome.suggestion->empty()) {
      report.suggestions.push_back(
          ReportSuggestion{outcome.rule_name, *outcome.suggestion, outcome.severity});
    }

    if (outcome.passed) {
      ++report.summary.passed_rules;
    } else {
      ++report.summary.failed_rules;
    }
    if (outcome.severity == Severity::kError) {
      ++report.summary.errors;
    } else if (outcome.severity == Severity::kWarning) {
      ++report.summary.warnings;
    }
  }

  report.summary.total_rules = report.results.size();
  report.passed = report.summary.errors == 0;
  return report;
}

bool RuleEvaluator::add_custom_rule(std::unique_ptr<OutfitRule> rule) {
  return library_.add(std::move(rule));
}

bool RuleEvaluator::configure_rule(std::string_view name, std::optional<double> weight,
                                   std::optional<bool> enabled) {
  return library_.configure(name, weight, enabled);
}

}  // namespace osim::rules
