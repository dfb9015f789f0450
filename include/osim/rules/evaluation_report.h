#pragma once

#include "osim/rules/rule_result.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace osim::rules {

struct RuleOutcome {
  std::string rule_name;
  std::string rule_description;
  bool passed{true};
  double score{100.0};
  std::string message;
  std::optional<std::string> suggestion;
  Severity severity{Severity::kInfo};
  double weight{1.0};
};

struct ReportSuggestion {
  std::string rule;
  std::string suggestion;
  Severity severity{Severity::kInfo};
};

struct ReportSummary {
  std::size_t total_rules{0};
  std::size_t passed_rules{0};
  std::size_t failed_rules{0};
  std::size_t errors{0};
  std::size_t warnings{0};
};

// EvaluationReport aggregates the outcome of every enabled rule.
// score is the weight-averaged rule score rounded to two decimals (0 when no
// rule ran); passed is false iff any rule reported Severity::kError.
struct EvaluationReport {
  double score{0.0};
  bool passed{true};
  std::vector<RuleOutcome> results;
  std::vector<ReportSuggestion> suggestions;
  ReportSummary summary;
};

}  // namespace osim::rules
