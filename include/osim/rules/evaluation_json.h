#pragma once

#include "osim/rules/evaluation_report.h"
#include "osim/rules/outfit_record.h"

#include <nlohmann/json.hpp>

namespace osim::rules {

/// Serialize an EvaluationReport. "suggestion" is null when a rule gave none.
[[nodiscard]] nlohmann::json evaluation_report_to_json(const EvaluationReport& report);

/// Deserialize an EvaluationReport written by evaluation_report_to_json.
/// Throws nlohmann::json::exception on missing or mistyped fields.
[[nodiscard]] EvaluationReport evaluation_report_from_json(const nlohmann::json& j);

/// Parse a context object. String values are kept as given; any other value
/// is kept as its compact JSON text ({"temperature": 20} -> "20").
/// Throws std::invalid_argument when `j` is not an object.
[[nodiscard]] ContextMap context_from_json(const nlohmann::json& j);

/// Parse an evaluation request:
///   {"colors": [[r,g,b] | "name", ...], "styles": {slot: label},
///    "context": {"type": ...}, "top_colors": [...], "bottom_colors": [...]}
/// Every key is optional; null is treated as absent. Throws
/// nlohmann::json::exception on mistyped fields and std::invalid_argument on
/// malformed colors (wrong arity, channel outside [0, 255]) or a context
/// that is not an object.
[[nodiscard]] OutfitInput outfit_input_from_json(const nlohmann::json& j);

}  // namespace osim::rules
