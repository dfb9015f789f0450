#pragma once

#include <chrono>
#include <string>
#include <utility>

namespace osim::core {

// Timestamp source for analysis responses and stored evaluations.
// Timestamps are UTC, ISO 8601, millisecond precision: "2026-10-18T09:30:05.042Z".
class IClock {
 public:
  virtual ~IClock() = default;

  virtual std::string now_iso8601() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

[[nodiscard]] std::string format_iso8601(std::chrono::system_clock::time_point tp);

class SystemClock final : public IClock {
 public:
  std::string now_iso8601() override;
};

// Returns the same timestamp on every call; used to pin analysis output in tests.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::string fixed_time) : fixed_time_(std::move(fixed_time)) {}

  std::string now_iso8601() override;

 private:
  std::string fixed_time_;
};

}  // namespace osim::core
