#pragma once

#include "rqcd/rules/rule_findings.h"
#include "rqcd/scoring/statistical_scorer.h"
#include "rqcd/verdict/thresholds.h"
#include "rqcd/verdict/verdict.h"

#include <cstddef>
#include <string>
#include <string_view>

namespace rqcd::verdict {

// Pure mapping from reason count to status: 0 → Clear, 1 → PartiallyClear, ≥2 → Unclear.
[[nodiscard]] constexpr ClarityStatus status_for_reason_count(const std::size_t count) noexcept {
  if (count == 0) {
    return ClarityStatus::kClear;
  }
  return count == 1 ? ClarityStatus::kPartiallyClear : ClarityStatus::kUnclear;
}

// Pure mapping from reason count to severity: 0 → 1, 1 → 2, ≥2 → 3.
[[nodiscard]] constexpr int severity_for_reason_count(const std::size_t count) noexcept {
  if (count == 0) {
    return 1;
  }
  return count == 1 ? 2 : 3;
}

// aggregate merges rule findings and the classifier result into a verdict.
// Reasons are emitted in the fixed order VAGUE_TERMS, NO_CONSTRAINTS, COMPLEX_SENTENCE,
// ML_AMBIGUITY, at most one each. The ML reason requires probability > ml_threshold.
// The explanation is attached by the caller (see explainability.h).
[[nodiscard]] Verdict aggregate(std::string_view text, const rules::RuleFindings& findings,
                                const scoring::ClassifierResult& classifier,
                                const Thresholds& thresholds);

// A verdict carrying exactly one input-policy reason (EMPTY_INPUT or ANALYSIS_ERROR).
// No rule or classifier facts are set.
[[nodiscard]] Verdict make_single_reason_verdict(std::string_view text, ReasonTag tag,
                                                 std::string message);

}  // namespace rqcd::verdict
