#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

namespace rqcd::core {

// format_sequence_id renders "<prefix>-<sequence>" with the sequence zero-padded to
// six digits, so ids from one generator sort in creation order ("analysis-000042").
[[nodiscard]] std::string format_sequence_id(std::string_view prefix, std::uint64_t sequence);

// IIdGenerator hands out analysis record ids.
// Contract: every id is non-empty, starts with "<prefix>-" and is unique per generator.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  virtual std::string next(std::string_view prefix) = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// Ids stay unique across CLI runs that share one history database:
// "<prefix>-<unix millis at startup>-<sequence>".
class SystemIdGenerator final : public IIdGenerator {
 public:
  SystemIdGenerator();

  std::string next(std::string_view prefix) override;

 private:
  std::string run_stamp_;
  std::atomic<std::uint64_t> sequence_{0};
};

// Sequence only, starting at 1. Same calls, same ids.
class DeterministicIdGenerator final : public IIdGenerator {
 public:
  std::string next(std::string_view prefix) override;

 private:
  std::atomic<std::uint64_t> sequence_{0};
};

}  // namespace rqcd::core
