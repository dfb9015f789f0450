#include "osim/storage/evaluation_store.h"

#include <algorithm>

namespace osim::storage {

core::Result<bool, std::string> InMemoryEvaluationStore::append(const EvaluationRecord& record) {
  if (get(record.evaluation_id).has_value()) {
    return core::Result<bool, std::string>::err("Duplicate evaluation_id: " +
                                                record.evaluation_id);
  }
  records_.push_back(record);
  return core::Result<bool, std::string>::ok(true);
}

std::optional<EvaluationRecord> InMemoryEvaluationStore::get(
    const std::string& evaluation_id) const {
  const auto it =
      std::find_if(records_.begin(), records_.end(),
                   [&](const EvaluationRecord& r) { return r.evaluation_id == evaluation_id; });
  if (it == records_.end()) {
    return std::nullopt;
  }
  return *it;
}

std::vector<EvaluationRecord> InMemoryEvaluationStore::list_recent(std::size_t limit) const {
  std::vector<EvaluationRecord> result;
  const std::size_t count = std::min(limit, records_.size());
  result.reserve(count);
  for (auto it = records_.rbegin(); it != records_.rend() && result.size() < count; ++it) {
    result.push_back(*it);
  }
  return result;
}

}  // namespace osim::storage
