#include "osim/rules/evaluation_json.h"

#include "osim/color/color_json.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace osim::rules {

namespace {

Severity severity_from_json(const nlohmann::json& j) {
  const auto text = j.get<std::string>();
  const auto severity = parse_severity(text);
  if (!severity.has_value()) {
    throw std::invalid_argument("unknown severity: " + text);
  }
  return *severity;
}

ColorSpec color_spec_from_json(const nlohmann::json& j) {
  if (j.is_string()) {
    return j.get<std::string>();
  }
  return color::color_from_json(j);
}

std::optional<std::vector<ColorSpec>> color_list_from_json(const nlohmann::json& j,
                                                           const char* key) {
  if (!j.contains(key) || j[key].is_null()) {
    return std::nullopt;
  }
  const auto& arr = j[key];
  if (!arr.is_array()) {
    throw std::invalid_argument(std::string(key) + " must be an array");
  }
  std::vector<ColorSpec> colors;
  colors.reserve(arr.size());
  for (const auto& item : arr) {
    colors.push_back(color_spec_from_json(item));
  }
  return colors;
}

}  // namespace

nlohmann::json evaluation_report_to_json(const EvaluationReport& report) {
  nlohmann::json j;
  j["score"] = report.score;
  j["passed"] = report.passed;

  nlohmann::json results = nlohmann::json::array();
  for (const auto& r : report.results) {
    nlohmann::json rj;
    rj["rule_name"] = r.rule_name;
    rj["rule_description"] = r.rule_description;
    rj["passed"] = r.passed;
    rj["score"] = r.score;
    rj["message"] = r.message;
    rj["suggestion"] = r.suggestion.has_value() ? nlohmann::json(*r.suggestion) : nlohmann::json();
    rj["severity"] = std::string(severity_to_string(r.severity));
    rj["weight"] = r.weight;
    results.push_back(rj);
  }
  j["results"] = results;

  nlohmann::json suggestions = nlohmann::json::array();
  for (const auto& s : report.suggestions) {
    suggestions.push_back({{"rule", s.rule},
                           {"suggestion", s.suggestion},
                           {"severity", std::string(severity_to_string(s.severity))}});
  }
  j["suggestions"] = suggestions;

  j["summary"] = {{"total_rules", report.summary.total_rules},
                  {"passed_rules", report.summary.passed_rules},
                  {"failed_rules", report.summary.failed_rules},
                  {"errors", report.summary.errors},
                  {"warnings", report.summary.warnings}};
  return j;
}

EvaluationReport evaluation_report_from_json(const nlohmann::json& j) {
  EvaluationReport report;
  report.score = j.at("score").get<double>();
  report.passed = j.at("passed").get<bool>();

  for (const auto& rj : j.at("results")) {
    RuleOutcome outcome;
    outcome.rule_name = rj.at("rule_name").get<std::string>();
    outcome.rule_description = rj.value("rule_description", "");
    outcome.passed = rj.at("passed").get<bool>();
    outcome.score = rj.at("score").get<double>();
    outcome.message = rj.value("message", "");
    if (rj.contains("suggestion") && !rj["suggestion"].is_null()) {
      outcome.suggestion = rj["suggestion"].get<std::string>();
    }
    outcome.severity = severity_from_json(rj.at("severity"));
    outcome.weight = rj.at("weight").get<double>();
    report.results.push_back(std::move(outcome));
  }

  if (j.contains("suggestions")) {
    for (const auto& sj : j["suggestions"]) {
      report.suggestions.push_back(ReportSuggestion{sj.at("rule").get<std::string>(),
                                                    sj.at("suggestion").get<std::string>(),
                                                    severity_from_json(sj.at("severity"))});
    }
  }

  const auto& summary = j.at("summary");
  report.summary.total_rules = summary.at("total_rules").get<std::size_t>();
  report.summary.passed_rules = summary.at("passed_rules").get<std::size_t>();
  report.summary.failed_rules = summary.at("failed_rules").get<std::size_t>();
  report.summary.errors = summary.at("errors").get<std::size_t>();
  report.summary.warnings = summary.at("warnings").get<std::size_t>();
  return report;
}

ContextMap context_from_json(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw std::invalid_argument("context must be a JSON object");
  }
  ContextMap context;
  for (const auto& [key, value] : j.items()) {
    context[key] = value.is_string() ? value.get<std::string>() : value.dump();
  }
  return context;
}

OutfitInput outfit_input_from_json(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw std::invalid_argument("evaluation request must be a JSON object");
  }

  OutfitInput input;
  input.colors = color_list_from_json(j, "colors");
  input.top_colors = color_list_from_json(j, "top_colors");
  input.bottom_colors = color_list_from_json(j, "bottom_colors");

  if (j.contains("styles") && !j["styles"].is_null()) {
    input.styles = j["styles"].get<StyleMap>();
  }
  if (j.contains("context") && !j["context"].is_null()) {
    input.context = context_from_json(j["context"]);
  }
  return input;
}

}  // namespace osim::rules
