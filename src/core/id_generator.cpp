#include "rqcd/core/id_generator.h"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace rqcd::core {

std::string format_sequence_id(const std::string_view prefix, const std::uint64_t sequence) {
  std::ostringstream oss;
  oss << prefix << '-' << std::setw(6) << std::setfill('0') << sequence;
  return oss.str();
}

SystemIdGenerator::SystemIdGenerator() {
  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  run_stamp_ =
      std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count());
}

std::string SystemIdGenerator::next(const std::string_view prefix) {
  const auto sequence = sequence_.fetch_add(1, std::memory_order_relaxed) + 1;
  return format_sequence_id(std::string(prefix) + "-" + run_stamp_, sequence);
}

std::string DeterministicIdGenerator::next(const std::string_view prefix) {
  return format_sequence_id(prefix, sequence_.fetch_add(1, std::memory_order_relaxed) + 1);
}

}  // namespace rqcd::core
