#include "osim/core/id_generator.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace osim::core {

std::string SystemIdGenerator::next_evaluation_id() {
  const auto time_t_now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm utc{};
  gmtime_r(&time_t_now, &utc);

  const auto c = counter_.fetch_add(1, std::memory_order_relaxed);
  std::ostringstream oss;
  oss << kEvaluationIdPrefix << '-' << std::put_time(&utc, "%Y%m%d_%H%M%S") << '-' << c;
  return oss.str();
}

std::string DeterministicIdGenerator::next_evaluation_id() {
  const auto c = counter_.fetch_add(1, std::memory_order_relaxed);
  return std::string(kEvaluationIdPrefix) + "-" + std::to_string(c);
}

}  // namespace osim::core
