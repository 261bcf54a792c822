#pragma once

#include "rqcd/core/types.h"
#include "rqcd/lexicon/lexicon.h"
#include "rqcd/scoring/statistical_scorer.h"
#include "rqcd/verdict/reason.h"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace rqcd::verdict {

enum class ClarityStatus {
  kClear,
  kPartiallyClear,
  kUnclear,
};

// Display names as shown to users ("Partially Clear").
[[nodiscard]] constexpr const char* to_string(const ClarityStatus status) noexcept {
  switch (status) {
    case ClarityStatus::kClear:
      return "Clear";
    case ClarityStatus::kPartiallyClear:
      return "Partially Clear";
    case ClarityStatus::kUnclear:
      return "Unclear";
  }
  return "Unknown";
}

// Explanation is the presentation-agnostic detail attached to a verdict:
// chart data for influential words and highlight spans for vague terms.
struct Explanation {
  std::vector<scoring::WordWeight> word_weights;  // Same order as the classifier result
  std::vector<std::string> labels;                // Per word: "unclear" (w > 0) or "clear"
  std::vector<core::TextSpan> highlight_spans;    // Sorted, non-overlapping

  bool operator==(const Explanation&) const = default;
};

// Verdict is the complete, explainable result for one statement.
// status and severity are derived from reasons.size() alone.
struct Verdict {
  std::string text;
  ClarityStatus status{ClarityStatus::kClear};
  int severity{1};
  std::vector<Reason> reasons;

  // Rule facts
  std::vector<lexicon::VagueTermMatch> vague_matches;
  bool has_constraint{false};
  std::optional<std::string> constraint_evidence;  // First constraint found ("2 seconds")
  bool is_complex{false};
  std::size_t token_count{0};

  scoring::ClassifierResult classifier;
  Explanation explanation;

  // ResourceDegradation notices and similar non-fatal conditions.
  std::vector<std::string> warnings;

  bool operator==(const Verdict&) const = default;

  // Reason labels, sorted and deduplicated.
  [[nodiscard]] std::vector<std::string> tags() const {
    std::vector<std::string> out;
    out.reserve(reasons.size());
    for (const auto& reason : reasons) {
      out.emplace_back(to_label(reason.tag));
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
  }

  [[nodiscard]] bool has_tag(const ReasonTag tag) const {
    return std::any_of(reasons.begin(), reasons.end(),
                       [tag](const Reason& reason) { return reason.tag == tag; });
  }

  [[nodiscard]] std::vector<std::string> vague_terms() const {
    std::vector<std::string> out;
    out.reserve(vague_matches.size());
    for (const auto& match : vague_matches) {
      out.push_back(match.term);
    }
    return out;
  }
};

}  // namespace rqcd::verdict
