#pragma once

#include "osim/storage/evaluation_store.h"
#include "osim/storage/sqlite/sqlite_db.h"

#include <memory>

namespace osim::storage::sqlite {

// SQLite-backed evaluation history. Reports are stored as JSON text;
// list_recent() orders by the autoincrement sequence, newest first.
// Requires schema v1 (SqliteDb::ensure_schema_v1) to be applied.
class SqliteEvaluationStore final : public IEvaluationStore {
 public:
  explicit SqliteEvaluationStore(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] core::Result<bool, std::string> append(const EvaluationRecord& record) override;

  [[nodiscard]] std::optional<EvaluationRecord> get(
      const std::string& evaluation_id) const override;

  [[nodiscard]] std::vector<EvaluationRecord> list_recent(std::size_t limit) const override;

 private:
  [[nodiscard]] static EvaluationRecord row_to_record(sqlite3_stmt* stmt);

  std::shared_ptr<SqliteDb> db_;
};

}  // namespace osim::storage::sqlite
