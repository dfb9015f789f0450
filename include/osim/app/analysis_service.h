#pragma once

#include "osim/color/color_extractor.h"
#include "osim/color/combo_scorer.h"
#include "osim/color/image.h"
#include "osim/core/clock.h"
#include "osim/core/errors.h"
#include "osim/core/id_generator.h"
#include "osim/core/result.h"
#include "osim/rules/evaluation_report.h"
#include "osim/rules/outfit_record.h"
#include "osim/rules/rule_library.h"
#include "osim/storage/evaluation_store.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace osim::app {

// ────────────────────────────────────────────────────────────────
// Analysis Pipeline
// ────────────────────────────────────────────────────────────────

inline constexpr int kAnalysisClusterCount = 5;

struct AnalysisRequest {
  color::Image image;
  color::ExtractionOptions extraction{kAnalysisClusterCount};

  // Style labels per slot from the caller (or an external style classifier).
  // Empty maps are passed to the rules as absent.
  rules::StyleMap styles;
  rules::ContextMap context;
};

struct AnalysisResponse {
  std::vector<color::DominantColor> colors;
  color::ComboEvaluation color_evaluation;
  rules::EvaluationReport rule_evaluation;
  std::string timestamp;
};

// Extract dominant colors, score their combination, then evaluate the outfit
// rules on those colors plus the supplied styles and context.
// Fails only when extraction fails (empty or malformed image).
[[nodiscard]] core::Result<AnalysisResponse, core::ImageDecodeError> run_analysis_pipeline(
    const AnalysisRequest& req, rules::RuleLibrary& library, core::IClock& clock);

/// {"colors": [...], "color_evaluation": {...}, "rule_evaluation": {...}, "timestamp": ...}
[[nodiscard]] nlohmann::json analysis_response_to_json(const AnalysisResponse& resp);

// ────────────────────────────────────────────────────────────────
// Evaluation history
// ────────────────────────────────────────────────────────────────

// Assign an id ("eval-...") and timestamp to a report and append it to the store.
[[nodiscard]] core::Result<storage::EvaluationRecord, std::string> record_evaluation(
    storage::IEvaluationStore& store, std::string source, rules::EvaluationReport report,
    core::IIdGenerator& id_gen, core::IClock& clock);

[[nodiscard]] nlohmann::json evaluation_record_to_json(const storage::EvaluationRecord& record);

}  // namespace osim::app
