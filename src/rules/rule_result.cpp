#include "osim/rules/rule_result.h"

namespace osim::rules {

std::string_view severity_to_string(Severity severity) noexcept {
  switch (severity) {
    case Severity::kInfo:
      return "info";
    case Severity::kWarning:
      return "warning";
    case Severity::kError:
      return "error";
  }
  return "info";
}

std::optional<Severity> parse_severity(std::string_view text) noexcept {
  if (text == "info") {
    return Severity::kInfo;
  }
  if (text == "warning") {
    return Severity::kWarning;
  }
  if (text == "error") {
    return Severity::kError;
  }
  return std::nullopt;
}

}  // namespace osim::rules
