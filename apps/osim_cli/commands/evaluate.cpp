#include "evaluate.h"

#include "osim/app/analysis_service.h"
#include "osim/core/clock.h"
#include "osim/core/errors.h"
#include "osim/core/id_generator.h"
#include "osim/imageio/image_loader.h"
#include "osim/rules/evaluation_json.h"
#include "osim/rules/rule_evaluator.h"
#include "osim/storage/sqlite/sqlite_evaluation_store.h"

#include <nlohmann/json.hpp>

#include "cli_common.h"
#include "shared/arg_parser.h"
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

struct EvaluateCliConfig {
  std::optional<std::string> request_path;
  std::optional<std::string> rules_config_path;
  std::optional<std::string> db_path;
  bool verbose{false};
};

struct AnalyzeCliConfig {
  int k{osim::app::kAnalysisClusterCount};
  std::optional<std::string> context_type;
  osim::rules::StyleMap styles;
  std::optional<std::string> rules_config_path;
  std::optional<std::string> db_path;
  bool verbose{false};
};

// Appends the report to the history database. Returns the evaluation id, or
// nullopt after printing the error.
std::optional<std::string> persist(const std::string& db_path, std::string source,
                                   osim::rules::EvaluationReport report, bool verbose) {
  auto db = open_history_db(db_path);
  if (!db) {
    return std::nullopt;
  }
  osim::storage::sqlite::SqliteEvaluationStore store(db);
  osim::core::SystemIdGenerator id_gen;
  osim::core::SystemClock clock;

  auto recorded =
      osim::app::record_evaluation(store, std::move(source), std::move(report), id_gen, clock);
  if (!recorded.has_value()) {
    std::cerr << "Failed to store evaluation: " << recorded.error() << "\n";
    return std::nullopt;
  }
  log_verbose(verbose, "Stored " + recorded.value().evaluation_id + " in " + db_path);
  return recorded.value().evaluation_id;
}

}  // namespace

int cmd_evaluate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<osim::apps::Option<EvaluateCliConfig>> options = {
      {"--request", true, "Evaluation request JSON file",
       [](EvaluateCliConfig& c, const std::string& v) {
         c.request_path = v;
         return true;
       }},
      {"--rules-config", true, "Rule weight/enable overrides JSON file",
       [](EvaluateCliConfig& c, const std::string& v) {
         c.rules_config_path = v;
         return true;
       }},
      {"--db", true, "SQLite database for evaluation history",
       [](EvaluateCliConfig& c, const std::string& v) {
         c.db_path = v;
         return true;
       }},
      {"--verbose", false, "Log progress to stderr",
       [](EvaluateCliConfig& c, const std::string& /*v*/) {
         c.verbose = true;
         return true;
       }},
  };
  const auto parsed = osim::apps::parse_options(argc, argv, options);
  const auto& config = parsed.config;
  if (!parsed.ok || !parsed.positionals.empty() || !config.request_path.has_value()) {
    std::cerr << "Usage: osim_cli evaluate --request <file.json> [options]\n";
    osim::apps::print_options(std::cerr, options);
    return 1;
  }

  const auto request_json = load_json_file(*config.request_path);
  if (!request_json.has_value()) {
    return 1;
  }

  osim::rules::OutfitInput input;
  try {
    input = osim::rules::outfit_input_from_json(*request_json);
  } catch (const std::exception& e) {
    std::cerr << "Invalid request " << *config.request_path << ": " << e.what() << "\n";
    return 1;
  }

  auto library = build_rule_library(config.rules_config_path, config.verbose);
  if (!library.has_value()) {
    return 1;
  }

  log_verbose(config.verbose, "Evaluating " + std::to_string(library->get_enabled().size()) +
                                  " enabled rules");
  const osim::rules::RuleEvaluator evaluator{*library};
  const auto report = evaluator.evaluate_outfit(input);

  nlohmann::json out = osim::rules::evaluation_report_to_json(report);
  if (config.db_path.has_value()) {
    auto id = persist(*config.db_path, "request:" + *config.request_path, report, config.verbose);
    if (!id.has_value()) {
      return 1;
    }
    out["evaluation_id"] = *id;
  }

  std::cout << out.dump(2) << "\n";
  return 0;
}

int cmd_analyze(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto slot_option = [](const char* flag, const char* slot) {
    return osim::apps::Option<AnalyzeCliConfig>{
        flag, true, std::string("Garment label for the ") + slot + " slot",
        [slot](AnalyzeCliConfig& c, const std::string& v) {
          c.styles[slot] = v;
          return true;
        }};
  };

  const std::vector<osim::apps::Option<AnalyzeCliConfig>> options = {
      {"--k", true, "Number of clusters (default 5)",
       [](AnalyzeCliConfig& c, const std::string& v) {
         const auto k = parse_positive_int(v);
         if (!k.has_value()) {
           std::cerr << "Invalid --k: " << v << " (expected a positive integer)\n";
           return false;
         }
         c.k = *k;
         return true;
       }},
      {"--context", true, "Occasion type (formal occasion, business, work, casual, sport, party)",
       [](AnalyzeCliConfig& c, const std::string& v) {
         c.context_type = v;
         return true;
       }},
      slot_option("--top", "top"),
      slot_option("--bottom", "bottom"),
      slot_option("--shoes", "shoes"),
      {"--rules-config", true, "Rule weight/enable overrides JSON file",
       [](AnalyzeCliConfig& c, const std::string& v) {
         c.rules_config_path = v;
         return true;
       }},
      {"--db", true, "SQLite database for evaluation history",
       [](AnalyzeCliConfig& c, const std::string& v) {
         c.db_path = v;
         return true;
       }},
      {"--verbose", false, "Log progress to stderr",
       [](AnalyzeCliConfig& c, const std::string& /*v*/) {
         c.verbose = true;
         return true;
       }},
  };
  const auto parsed = osim::apps::parse_options(argc, argv, options);
  const auto& config = parsed.config;
  if (!parsed.ok || parsed.positionals.size() != 1) {
    std::cerr << "Usage: osim_cli analyze <image> [options]\n";
    osim::apps::print_options(std::cerr, options);
    return 1;
  }
  const auto& path = parsed.positionals[0];

  auto library = build_rule_library(config.rules_config_path, config.verbose);
  if (!library.has_value()) {
    return 1;
  }

  log_verbose(config.verbose, "Decoding " + path);
  auto image = osim::imageio::load_image(path);
  if (!image.has_value()) {
    std::cerr << "Image error ("
              << osim::core::image_error_code_to_string(image.error().code)
              << "): " << image.error().detail << "\n";
    return 1;
  }

  osim::app::AnalysisRequest req;
  req.image = image.value();
  req.extraction.k = config.k;
  req.styles = config.styles;
  if (config.context_type.has_value()) {
    req.context["type"] = *config.context_type;
  }

  osim::core::SystemClock clock;
  auto result = osim::app::run_analysis_pipeline(req, *library, clock);
  if (!result.has_value()) {
    std::cerr << "Analysis failed ("
              << osim::core::image_error_code_to_string(result.error().code)
              << "): " << result.error().detail << "\n";
    return 1;
  }
  log_verbose(config.verbose,
              "Extracted " + std::to_string(result.value().colors.size()) + " dominant colors");

  nlohmann::json out = osim::app::analysis_response_to_json(result.value());
  if (config.db_path.has_value()) {
    auto id = persist(*config.db_path, "image:" + path, result.value().rule_evaluation,
                      config.verbose);
    if (!id.has_value()) {
      return 1;
    }
    out["evaluation_id"] = *id;
  }

  std::cout << out.dump(2) << "\n";
  return 0;
}
