#include "cli_common.h"

#include "osim/config/rule_config.h"

#include <charconv>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string_view>
#include <system_error>
#include <vector>

void log_verbose(bool verbose, const std::string& message) {
  if (verbose) {
    std::cerr << "[osim] " << message << "\n";
  }
}

namespace {

std::optional<int> parse_int(std::string_view text) {
  int value = 0;
  const auto* begin = text.data();
  const auto* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc{} || ptr != end || text.empty()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::optional<osim::color::Color> parse_rgb_triplet(const std::string& text) {
  std::vector<int> channels;
  std::string_view rest{text};
  while (true) {
    const auto comma = rest.find(',');
    const auto part = rest.substr(0, comma);
    const auto value = parse_int(part);
    if (!value.has_value() || *value < 0 || *value > 255) {
      return std::nullopt;
    }
    channels.push_back(*value);
    if (comma == std::string_view::npos) {
      break;
    }
    rest = rest.substr(comma + 1);
  }
  if (channels.size() != 3) {
    return std::nullopt;
  }
  return osim::color::Color{static_cast<std::uint8_t>(channels[0]),
                            static_cast<std::uint8_t>(channels[1]),
                            static_cast<std::uint8_t>(channels[2])};
}

std::optional<int> parse_positive_int(const std::string& text) {
  const auto value = parse_int(text);
  if (!value.has_value() || *value < 1) {
    return std::nullopt;
  }
  return value;
}

std::optional<nlohmann::json> load_json_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    std::cerr << "Error: cannot open file: " << path << "\n";
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  auto parsed = nlohmann::json::parse(buffer.str(), nullptr, false);
  if (parsed.is_discarded()) {
    std::cerr << "Error: invalid JSON in " << path << "\n";
    return std::nullopt;
  }
  return parsed;
}

std::optional<osim::rules::RuleLibrary> build_rule_library(
    const std::optional<std::string>& rules_config_path, bool verbose) {
  auto library = osim::rules::make_default_rule_library();
  if (!rules_config_path.has_value()) {
    return library;
  }

  auto doc = load_json_file(*rules_config_path);
  if (!doc.has_value()) {
    return std::nullopt;
  }

  auto parsed = osim::config::parse_rule_config(*doc);
  if (!parsed.has_value()) {
    std::cerr << "Invalid rule config " << *rules_config_path << ": " << parsed.error() << "\n";
    return std::nullopt;
  }

  const auto unknown = osim::config::apply_rule_config(library, parsed.value());
  for (const auto& name : unknown) {
    std::cerr << "Warning: rule config names unknown rule '" << name << "'\n";
  }
  log_verbose(verbose, "Applied rule config " + *rules_config_path + " (" +
                           std::to_string(parsed.value().rules.size()) + " overrides)");
  return library;
}

std::shared_ptr<osim::storage::sqlite::SqliteDb> open_history_db(const std::string& path) {
  auto db_result = osim::storage::sqlite::SqliteDb::open(path);
  if (!db_result.has_value()) {
    std::cerr << "Failed to open database: " << db_result.error() << "\n";
    return nullptr;
  }
  auto db = db_result.value();
  auto schema_result = db->ensure_schema_v1();
  if (!schema_result.has_value()) {
    std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
    return nullptr;
  }
  return db;
}
