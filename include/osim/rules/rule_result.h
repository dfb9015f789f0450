#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace osim::rules {

enum class Severity {
  kInfo,
  kWarning,
  kError,
};

// Wire names "info" / "warning" / "error".
[[nodiscard]] std::string_view severity_to_string(Severity severity) noexcept;
[[nodiscard]] std::optional<Severity> parse_severity(std::string_view text) noexcept;

struct RuleResult {
  bool passed{true};
  double score{100.0};  // clamped to [0, 100] by OutfitRule::evaluate
  std::string message;
  std::optional<std::string> suggestion;
  Severity severity{Severity::kInfo};
  double weight{1.0};  // overwritten with the rule's weight by OutfitRule::evaluate
};

}  // namespace osim::rules
