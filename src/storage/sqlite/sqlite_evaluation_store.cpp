#include "osim/storage/sqlite/sqlite_evaluation_store.h"

#include "osim/rules/evaluation_json.h"

#include <nlohmann/json.hpp>
#include <sqlite3.h>

#include <utility>

namespace osim::storage::sqlite {

SqliteEvaluationStore::SqliteEvaluationStore(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

core::Result<bool, std::string> SqliteEvaluationStore::append(const EvaluationRecord& record) {
  using AppendResult = core::Result<bool, std::string>;

  const char* sql = R"(
    INSERT INTO evaluations (evaluation_id, source, created_at, report_json)
    VALUES (?, ?, ?, ?)
  )";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return AppendResult::err("Failed to prepare insert: " + stmt.error());
  }

  const std::string json_str = rules::evaluation_report_to_json(record.report).dump();

  sqlite3_bind_text(stmt.get(), 1, record.evaluation_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, record.source.c_str(), -1, SQLITE_TRANSIENT);
  if (record.created_at.has_value()) {
    sqlite3_bind_text(stmt.get(), 3, record.created_at->c_str(), -1, SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(stmt.get(), 3);
  }
  sqlite3_bind_text(stmt.get(), 4, json_str.c_str(), -1, SQLITE_TRANSIENT);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return AppendResult::err("Failed to store evaluation " + record.evaluation_id + ": " +
                             sqlite3_errmsg(db_->connection()));
  }
  return AppendResult::ok(true);
}

std::optional<EvaluationRecord> SqliteEvaluationStore::get(
    const std::string& evaluation_id) const {
  const char* sql =
      "SELECT evaluation_id, source, created_at, report_json "
      "FROM evaluations WHERE evaluation_id = ?";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return std::nullopt;
  }

  sqlite3_bind_text(stmt.get(), 1, evaluation_id.c_str(), -1, SQLITE_TRANSIENT);

  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return row_to_record(stmt.get());
  }
  return std::nullopt;
}

std::vector<EvaluationRecord> SqliteEvaluationStore::list_recent(std::size_t limit) const {
  const char* sql =
      "SELECT evaluation_id, source, created_at, report_json "
      "FROM evaluations ORDER BY seq DESC LIMIT ?";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return {};
  }

  sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(limit));

  std::vector<EvaluationRecord> result;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    result.push_back(row_to_record(stmt.get()));
  }
  return result;
}

// Column order: evaluation_id(0), source(1), created_at(2), report_json(3)
EvaluationRecord SqliteEvaluationStore::row_to_record(sqlite3_stmt* stmt) {
  EvaluationRecord record;
  record.evaluation_id = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));  // NOLINT
  record.source = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));         // NOLINT
  if (sqlite3_column_type(stmt, 2) != SQLITE_NULL) {
    record.created_at = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));  // NOLINT
  }
  const std::string json_str =
      reinterpret_cast<const char*>(sqlite3_column_text(stmt, 3));  // NOLINT
  record.report = rules::evaluation_report_from_json(nlohmann::json::parse(json_str));
  return record;
}

}  // namespace osim::storage::sqlite
