#pragma once

#include "rqcd/core/types.h"
#include "rqcd/lexicon/constraint_matcher.h"

#include <string>
#include <string_view>
#include <vector>

namespace rqcd::lexicon {

// VagueTermMatch is one lexicon term found in a statement, with every place it occurs.
// A term appears at most once per analysis; repeated occurrences only add spans.
struct VagueTermMatch {
  std::string term;                  // Lexicon spelling (lower-case)
  std::vector<core::TextSpan> spans;  // Occurrences in the original text, ascending

  bool operator==(const VagueTermMatch&) const = default;
};

// PhraseMatchMode selects how a vague term must sit in the text.
enum class PhraseMatchMode {
  kWordBoundary,  // Term must start and end at a non-alphanumeric boundary ("fast" not in "breakfast")
  kSubstring,     // Any case-insensitive occurrence counts
};

// Lexicon is the static vocabulary the rule engine checks statements against:
// a list of subjective/unmeasurable terms and the unit list behind the constraint recognizer.
// Immutable after construction; safe to share between threads.
class Lexicon {
 public:
  Lexicon(std::vector<std::string> vague_terms, std::vector<std::string> units,
          PhraseMatchMode match_mode = PhraseMatchMode::kWordBoundary);

  // Lower-cased, trimmed, deduplicated; configured order is preserved.
  [[nodiscard]] const std::vector<std::string>& vague_terms() const noexcept {
    return vague_terms_;
  }
  [[nodiscard]] const std::vector<std::string>& units() const noexcept {
    return constraint_matcher_.units();
  }
  [[nodiscard]] const ConstraintMatcher& constraint_matcher() const noexcept {
    return constraint_matcher_;
  }

  // All lexicon terms that occur in text, in lexicon order.
  [[nodiscard]] std::vector<VagueTermMatch> find_vague_terms(std::string_view text) const;

  [[nodiscard]] bool has_constraint(std::string_view text) const {
    return constraint_matcher_.has_constraint(text);
  }

 private:
  std::vector<std::string> vague_terms_;
  ConstraintMatcher constraint_matcher_;
  PhraseMatchMode match_mode_;

  [[nodiscard]] std::vector<core::TextSpan> find_occurrences(std::string_view lowered,
                                                             std::string_view term) const;
};

[[nodiscard]] std::vector<std::string> default_vague_terms();
[[nodiscard]] std::vector<std::string> default_units();
[[nodiscard]] Lexicon default_lexicon();

}  // namespace rqcd::lexicon
