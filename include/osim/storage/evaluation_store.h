#pragma once

#include "osim/core/result.h"
#include "osim/rules/evaluation_report.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace osim::storage {

// A persisted evaluation: the report plus where it came from ("request:<file>",
// "image:<file>", ...).
struct EvaluationRecord {
  std::string evaluation_id;
  std::string source;
  std::optional<std::string> created_at;  // ISO-8601 UTC
  rules::EvaluationReport report;
};

// IEvaluationStore keeps an append-only history of evaluations.
//
// append() rejects an evaluation_id that is already stored.
// list_recent() returns records newest first, by insertion order (not by
// created_at, which may be absent or coarse).
class IEvaluationStore {
 public:
  virtual ~IEvaluationStore() = default;

  [[nodiscard]] virtual core::Result<bool, std::string> append(const EvaluationRecord& record) = 0;

  [[nodiscard]] virtual std::optional<EvaluationRecord> get(
      const std::string& evaluation_id) const = 0;

  [[nodiscard]] virtual std::vector<EvaluationRecord> list_recent(std::size_t limit) const = 0;

 protected:
  IEvaluationStore() = default;
  IEvaluationStore(const IEvaluationStore&) = default;
  IEvaluationStore& operator=(const IEvaluationStore&) = default;
  IEvaluationStore(IEvaluationStore&&) = default;
  IEvaluationStore& operator=(IEvaluationStore&&) = default;
};

// In-memory implementation. Ephemeral; contents are lost with the instance.
class InMemoryEvaluationStore final : public IEvaluationStore {
 public:
  [[nodiscard]] core::Result<bool, std::string> append(const EvaluationRecord& record) override;

  [[nodiscard]] std::optional<EvaluationRecord> get(
      const std::string& evaluation_id) const override;

  [[nodiscard]] std::vector<EvaluationRecord> list_recent(std::size_t limit) const override;

 private:
  std::vector<EvaluationRecord> records_;  // insertion order
};

}  // namespace osim::storage
