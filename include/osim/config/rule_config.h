#pragma once

#include "osim/core/result.h"
#include "osim/rules/rule_library.h"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace osim::config {

// Per-rule override. Absent fields leave the rule untouched.
struct RuleOverride {
  std::optional<double> weight;
  std::optional<bool> enabled;
};

// RuleConfig holds validated overrides keyed by rule name.
struct RuleConfig {
  std::map<std::string, RuleOverride> rules;
};

// parse_rule_config validates a rule configuration document:
//
//   {"rules": {"three_color": {"weight": 2.0, "enabled": true}, ...}}
//
// A missing "rules" key yields an empty config. Rejects a non-object document,
// non-object rule entries, non-numeric or non-positive weights, non-boolean
// "enabled" values. The error string names the offending rule.
[[nodiscard]] core::Result<RuleConfig, std::string> parse_rule_config(const nlohmann::json& j);

// apply_rule_config applies every override through RuleLibrary::configure.
// Returns the names of overrides that matched no rule, in name order.
std::vector<std::string> apply_rule_config(rules::RuleLibrary& library, const RuleConfig& config);

}  // namespace osim::config
