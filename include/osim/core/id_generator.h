#pragma once

#include <atomic>
#include <string>
#include <string_view>

namespace osim::core {

inline constexpr std::string_view kEvaluationIdPrefix = "eval";

// Source of evaluation ids for the history store.
// Contract: every id starts with "eval-" and is unique per generator instance.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  virtual std::string next_evaluation_id() = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// "eval-YYYYMMDD_HHMMSS-N": UTC second of creation plus a per-instance counter.
// Thread-safe.
class SystemIdGenerator final : public IIdGenerator {
 public:
  SystemIdGenerator() = default;

  SystemIdGenerator(const SystemIdGenerator&) = delete;
  SystemIdGenerator& operator=(const SystemIdGenerator&) = delete;

  std::string next_evaluation_id() override;

 private:
  std::atomic<unsigned long long> counter_{0};
};

// "eval-0", "eval-1", ...
class DeterministicIdGenerator final : public IIdGenerator {
 public:
  DeterministicIdGenerator() = default;

  DeterministicIdGenerator(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator& operator=(const DeterministicIdGenerator&) = delete;

  std::string next_evaluation_id() override;

 private:
  std::atomic<unsigned long long> counter_{0};
};

}  // namespace osim::core
