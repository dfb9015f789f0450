#pragma once

#include "osim/color/color.h"
#include "osim/rules/rule_library.h"
#include "osim/storage/sqlite/sqlite_db.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

// Shared helpers for osim_cli subcommands. All of them report failures on
// stderr and signal them through their return value.

// Writes "[osim] <message>" to stderr when verbose is set.
void log_verbose(bool verbose, const std::string& message);

// Parses "r,g,b" with each channel an integer in [0, 255].
[[nodiscard]] std::optional<osim::color::Color> parse_rgb_triplet(const std::string& text);

// Parses a positive integer option value ("--k", "--limit").
[[nodiscard]] std::optional<int> parse_positive_int(const std::string& text);

// Reads and parses a JSON file.
[[nodiscard]] std::optional<nlohmann::json> load_json_file(const std::string& path);

// Default rule library with the overrides from an optional --rules-config file applied.
// Unknown rule names in the file are reported as warnings.
[[nodiscard]] std::optional<osim::rules::RuleLibrary> build_rule_library(
    const std::optional<std::string>& rules_config_path, bool verbose);

// Opens the database and applies the history schema.
[[nodiscard]] std::shared_ptr<osim::storage::sqlite::SqliteDb> open_history_db(
    const std::string& path);
