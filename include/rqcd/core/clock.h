#pragma once

#include <string>
#include <utility>

namespace rqcd::core {

// IClock stamps analysis records. Timestamps are UTC, second precision,
// "YYYY-MM-DDTHH:MM:SSZ", so they sort lexicographically.
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

class SystemClock final : public IClock {
 public:
  std::string now_iso8601() override;
};

// FixedClock returns whatever time it was last given.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::string time) : time_(std::move(time)) {}

  std::string now_iso8601() override { return time_; }
  void set(std::string time) { time_ = std::move(time); }

 private:
  std::string time_;
};

}  // namespace rqcd::core
