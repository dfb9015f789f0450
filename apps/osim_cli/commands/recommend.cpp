#include "recommend.h"

#include "osim/advice/context_recommendations.h"

#include <nlohmann/json.hpp>

#include "cli_common.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct RecommendCliConfig {
  std::string context_type{"casual"};
};

struct RulesCliConfig {
  std::optional<std::string> rules_config_path;
  bool verbose{false};
};

}  // namespace

int cmd_recommend(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<osim::apps::Option<RecommendCliConfig>> options = {
      {"--context", true, "Occasion type (formal occasion, business, work, casual, sport)",
       [](RecommendCliConfig& c, const std::string& v) {
         c.context_type = v;
         return true;
       }},
  };
  const auto parsed = osim::apps::parse_options(argc, argv, options);
  if (!parsed.ok || !parsed.positionals.empty()) {
    std::cerr << "Usage: osim_cli recommend [options]\n";
    osim::apps::print_options(std::cerr, options);
    return 1;
  }

  const auto rec = osim::advice::recommend_for_context(parsed.config.context_type);
  std::cout << osim::advice::recommendation_to_json(rec).dump(2) << "\n";
  return 0;
}

int cmd_rules(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<osim::apps::Option<RulesCliConfig>> options = {
      {"--rules-config", true, "Rule weight/enable overrides JSON file",
       [](RulesCliConfig& c, const std::string& v) {
         c.rules_config_path = v;
         return true;
       }},
      {"--verbose", false, "Log progress to stderr",
       [](RulesCliConfig& c, const std::string& /*v*/) {
         c.verbose = true;
         return true;
       }},
  };
  const auto parsed = osim::apps::parse_options(argc, argv, options);
  if (!parsed.ok || !parsed.positionals.empty()) {
    std::cerr << "Usage: osim_cli rules [options]\n";
    osim::apps::print_options(std::cerr, options);
    return 1;
  }

  const auto library =
      build_rule_library(parsed.config.rules_config_path, parsed.config.verbose);
  if (!library.has_value()) {
    return 1;
  }

  nlohmann::json out = nlohmann::json::array();
  for (const auto* rule : library->all()) {
    out.push_back({{"name", rule->name()},
                   {"description", rule->description()},
                   {"weight", rule->weight()},
                   {"enabled", rule->enabled()}});
  }
  std::cout << out.dump(2) << "\n";
  return 0;
}
