#pragma once

#include <string>

namespace rqcd::verdict {

// ReasonTag is the issue category of a Reason. Each category contributes at most one
// reason per analysis. The declaration order of the first four is the order in which
// the aggregator emits them.
enum class ReasonTag {
  kVagueTerms,
  kNoConstraints,
  kComplexSentence,
  kMlAmbiguity,
  kEmptyInput,     // Blank statement; replaces all other checks
  kAnalysisError,  // Analysis of this statement failed; replaces all other checks
};

// Stable upper-case labels used in exports ("VAGUE_TERMS").
[[nodiscard]] constexpr const char* to_label(const ReasonTag tag) noexcept {
  switch (tag) {
    case ReasonTag::kVagueTerms:
      return "VAGUE_TERMS";
    case ReasonTag::kNoConstraints:
      return "NO_CONSTRAINTS";
    case ReasonTag::kComplexSentence:
      return "COMPLEX_SENTENCE";
    case ReasonTag::kMlAmbiguity:
      return "ML_AMBIGUITY";
    case ReasonTag::kEmptyInput:
      return "EMPTY_INPUT";
    case ReasonTag::kAnalysisError:
      return "ANALYSIS_ERROR";
  }
  return "UNKNOWN";
}

struct Reason {
  ReasonTag tag{ReasonTag::kVagueTerms};
  std::string message;

  bool operator==(const Reason&) const = default;
};

}  // namespace rqcd::verdict
