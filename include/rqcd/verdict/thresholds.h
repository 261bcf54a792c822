#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace rqcd::verdict {

// Thresholds are the tunable sensitivity settings of an analysis.
// They are injected per analyzer and may be adjusted per call; nothing below the
// analyzer hard-wires them.
struct Thresholds {
  std::size_t max_tokens{20};  // More tokens than this is a complex sentence
  double ml_threshold{0.6};    // P(unclear) strictly above this adds an ML reason
  std::size_t top_k{5};        // Influential words reported per statement

  bool operator==(const Thresholds&) const = default;
};

// ThresholdOverrides replace individual analyzer defaults for a single call.
struct ThresholdOverrides {
  std::optional<std::size_t> max_tokens;
  std::optional<double> ml_threshold;
  std::optional<std::size_t> top_k;
};

[[nodiscard]] Thresholds apply_overrides(const Thresholds& base, const ThresholdOverrides& overrides);

// validate_thresholds returns "" when usable, otherwise the first problem found:
// max_tokens >= 1, ml_threshold within [0, 1], top_k >= 1.
[[nodiscard]] std::string validate_thresholds(const Thresholds& thresholds);

}  // namespace rqcd::verdict
