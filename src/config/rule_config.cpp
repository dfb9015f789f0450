#include "osim/config/rule_config.h"

#include <utility>

namespace osim::config {

namespace {

using ParseResult = core::Result<RuleConfig, std::string>;

}  // namespace

ParseResult parse_rule_config(const nlohmann::json& j) {
  if (!j.is_object()) {
    return ParseResult::err("rule config must be a JSON object");
  }

  RuleConfig config;
  if (!j.contains("rules")) {
    return ParseResult::ok(std::move(config));
  }

  const auto& rules_json = j["rules"];
  if (!rules_json.is_object()) {
    return ParseResult::err("\"rules\" must be an object keyed by rule name");
  }

  for (const auto& item : rules_json.items()) {
    const std::string name = item.key();
    const auto& entry = item.value();
    if (!entry.is_object()) {
      return ParseResult::err("rule '" + name + "': override must be an object");
    }

    RuleOverride rule_override;
    if (entry.contains("weight")) {
      const auto& weight = entry["weight"];
      if (!weight.is_number()) {
        return ParseResult::err("rule '" + name + "': weight must be a number");
      }
      const double value = weight.get<double>();
      if (!(value > 0.0)) {
        return ParseResult::err("rule '" + name + "': weight must be positive");
      }
      rule_override.weight = value;
    }
    if (entry.contains("enabled")) {
      const auto& enabled = entry["enabled"];
      if (!enabled.is_boolean()) {
        return ParseResult::err("rule '" + name + "': enabled must be a boolean");
      }
      rule_override.enabled = enabled.get<bool>();
    }

    config.rules.emplace(name, rule_override);
  }

  return ParseResult::ok(std::move(config));
}

std::vector<std::string> apply_rule_config(rules::RuleLibrary& library, const RuleConfig& config) {
  std::vector<std::string> unknown;
  for (const auto& [name, rule_override] : config.rules) {
    if (!library.configure(name, rule_override.weight, rule_override.enabled)) {
      unknown.push_back(name);
    }
  }
  return unknown;
}

}  // namespace osim::config
