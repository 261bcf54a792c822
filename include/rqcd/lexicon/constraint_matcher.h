#pragma once

#include "rqcd/core/types.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rqcd::lexicon {

// ConstraintMatch is one measurable constraint found in a statement ("2 seconds", "10GB", "99.9%").
struct ConstraintMatch {
  std::string text;  // Slice of the original statement, original case
  std::string unit;  // Matched unit, lower-cased as configured
  core::TextSpan span;
};

// ConstraintMatcher recognizes a number bound to a unit.
//
// Grammar (case-insensitive):
//   number   := digits ("," ddd)* ("." digits)?     not preceded by a letter or digit
//   gap      := (" " | "\t")*
//   unit     := one configured unit, ending at a word boundary ("%" needs no boundary)
//
// Units are tried longest first so "ms" never shadows "mins" and vice versa.
class ConstraintMatcher {
 public:
  explicit ConstraintMatcher(std::vector<std::string> units);

  [[nodiscard]] std::optional<ConstraintMatch> find_first(std::string_view text) const;

  [[nodiscard]] bool has_constraint(std::string_view text) const {
    return find_first(text).has_value();
  }

  // Units in configured order (lower-cased, deduplicated).
  [[nodiscard]] const std::vector<std::string>& units() const noexcept { return units_; }

 private:
  std::vector<std::string> units_;
  std::vector<std::string> units_longest_first_;

  // Returns the unit that starts at `pos` in `lowered`, if any.
  [[nodiscard]] std::optional<std::string> unit_at(std::string_view lowered,
                                                   std::size_t pos) const;
};

}  // namespace rqcd::lexicon
