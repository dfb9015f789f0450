#include "history.h"

#include "osim/app/analysis_service.h"
#include "osim/storage/sqlite/sqlite_evaluation_store.h"

#include <nlohmann/json.hpp>

#include "cli_common.h"
#include "shared/arg_parser.h"
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct HistoryCliConfig {
  std::optional<std::string> db_path;
  int limit{20};
};

}  // namespace

int cmd_history(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<osim::apps::Option<HistoryCliConfig>> options = {
      {"--db", true, "SQLite database with evaluation history",
       [](HistoryCliConfig& c, const std::string& v) {
         c.db_path = v;
         return true;
       }},
      {"--limit", true, "Maximum number of records (default 20)",
       [](HistoryCliConfig& c, const std::string& v) {
         const auto limit = parse_positive_int(v);
         if (!limit.has_value()) {
           std::cerr << "Invalid --limit: " << v << " (expected a positive integer)\n";
           return false;
         }
         c.limit = *limit;
         return true;
       }},
  };
  const auto parsed = osim::apps::parse_options(argc, argv, options);
  const auto& config = parsed.config;
  if (!parsed.ok || !parsed.positionals.empty() || !config.db_path.has_value()) {
    std::cerr << "Usage: osim_cli history --db <path> [options]\n";
    osim::apps::print_options(std::cerr, options);
    return 1;
  }

  auto db = open_history_db(*config.db_path);
  if (!db) {
    return 1;
  }
  osim::storage::sqlite::SqliteEvaluationStore store(db);

  nlohmann::json out = nlohmann::json::array();
  try {
    for (const auto& record : store.list_recent(static_cast<std::size_t>(config.limit))) {
      out.push_back(osim::app::evaluation_record_to_json(record));
    }
  } catch (const std::exception& e) {
    // Rows are JSON written by this tool; a parse failure means a corrupt database.
    std::cerr << "Failed to read history: " << e.what() << "\n";
    return 1;
  }

  std::cout << out.dump(2) << "\n";
  return 0;
}
