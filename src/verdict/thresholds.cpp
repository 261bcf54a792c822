#include "rqcd/verdict/thresholds.h"

#include <cmath>

namespace rqcd::verdict {

Thresholds apply_overrides(const Thresholds& base, const ThresholdOverrides& overrides) {
  Thresholds merged = base;
  if (overrides.max_tokens.has_value()) {
    merged.max_tokens = *overrides.max_tokens;
  }
  if (overrides.ml_threshold.has_value()) {
    merged.ml_threshold = *overrides.ml_threshold;
  }
  if (overrides.top_k.has_value()) {
    merged.top_k = *overrides.top_k;
  }
  return merged;
}

std::string validate_thresholds(const Thresholds& thresholds) {
  if (thresholds.max_tokens < 1) {
    return "max_tokens must be at least 1";
  }
  if (!std::isfinite(thresholds.ml_threshold) || thresholds.ml_threshold < 0.0 ||
      thresholds.ml_threshold > 1.0) {
    return "ml_threshold must be within [0, 1]";
  }
  if (thresholds.top_k < 1) {
    return "top_k must be at least 1";
  }
  return "";
}

}  // namespace rqcd::verdict
