#include "osim/app/analysis_service.h"

#include "osim/color/color_json.h"
#include "osim/rules/evaluation_json.h"
#include "osim/rules/rule_evaluator.h"

#include <utility>

namespace osim::app {

core::Result<AnalysisResponse, core::ImageDecodeError> run_analysis_pipeline(
    const AnalysisRequest& req, rules::RuleLibrary& library, core::IClock& clock) {
  using PipelineResult = core::Result<AnalysisResponse, core::ImageDecodeError>;

  auto extracted = color::extract_dominant_colors(req.image, req.extraction);
  if (!extracted.has_value()) {
    return PipelineResult::err(extracted.error());
  }

  AnalysisResponse resp;
  resp.colors = extracted.value();

  std::vector<color::Color> palette;
  std::vector<rules::ColorSpec> specs;
  palette.reserve(resp.colors.size());
  specs.reserve(resp.colors.size());
  for (const auto& dc : resp.colors) {
    palette.push_back(dc.color);
    specs.emplace_back(dc.color);
  }

  resp.color_evaluation = color::evaluate_color_combo(palette);

  rules::OutfitInput input;
  input.colors = std::move(specs);
  if (!req.styles.empty()) {
    input.styles = req.styles;
  }
  if (!req.context.empty()) {
    input.context = req.context;
  }

  const rules::RuleEvaluator evaluator{library};
  resp.rule_evaluation = evaluator.evaluate_outfit(input);
  resp.timestamp = clock.now_iso8601();

  return PipelineResult::ok(std::move(resp));
}

nlohmann::json analysis_response_to_json(const AnalysisResponse& resp) {
  nlohmann::json j;
  j["colors"] = color::dominant_colors_to_json(resp.colors);
  j["color_evaluation"] = color::combo_evaluation_to_json(resp.color_evaluation);
  j["rule_evaluation"] = rules::evaluation_report_to_json(resp.rule_evaluation);
  j["timestamp"] = resp.timestamp;
  return j;
}

core::Result<storage::EvaluationRecord, std::string> record_evaluation(
    storage::IEvaluationStore& store, std::string source, rules::EvaluationReport report,
    core::IIdGenerator& id_gen, core::IClock& clock) {
  using RecordResult = core::Result<storage::EvaluationRecord, std::string>;

  storage::EvaluationRecord record;
  record.evaluation_id = id_gen.next_evaluation_id();
  record.source = std::move(source);
  record.created_at = clock.now_iso8601();
  record.report = std::move(report);

  auto appended = store.append(record);
  if (!appended.has_value()) {
    return RecordResult::err(appended.error());
  }
  return RecordResult::ok(std::move(record));
}

nlohmann::json evaluation_record_to_json(const storage::EvaluationRecord& record) {
  nlohmann::json j;
  j["evaluation_id"] = record.evaluation_id;
  j["source"] = record.source;
  j["created_at"] =
      record.created_at.has_value() ? nlohmann::json(*record.created_at) : nlohmann::json();
  j["report"] = rules::evaluation_report_to_json(record.report);
  return j;
}

}  // namespace osim::app
