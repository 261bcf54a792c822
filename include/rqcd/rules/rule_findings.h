#pragma once

#include "rqcd/lexicon/constraint_matcher.h"
#include "rqcd/lexicon/lexicon.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace rqcd::rules {

// RuleFindings is the output of the deterministic checks for one statement.
// Empty findings (no vague terms, a constraint present, short sentence) are the normal
// Clear-leaning case, not an error.
struct RuleFindings {
  std::vector<lexicon::VagueTermMatch> vague_matches;
  bool has_constraint{false};
  std::optional<lexicon::ConstraintMatch> first_constraint;  // Evidence for has_constraint
  bool is_complex{false};
  std::size_t token_count{0};
  std::size_t max_tokens{0};  // Threshold the complexity check ran with
};

}  // namespace rqcd::rules
