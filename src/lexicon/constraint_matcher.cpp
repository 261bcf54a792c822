#include "rqcd/lexicon/constraint_matcher.h"

#include "rqcd/core/normalization.h"

#include <algorithm>
#include <set>
#include <utility>

namespace rqcd::lexicon {

namespace {

bool digits_at(const std::string_view text, const std::size_t pos, const std::size_t count) {
  if (pos + count > text.size()) {
    return false;
  }
  for (std::size_t i = pos; i < pos + count; ++i) {
    if (!core::is_ascii_digit(text[i])) {
      return false;
    }
  }
  return true;
}

// Returns the end offset of the number starting at `pos` (which must be a digit).
std::size_t scan_number(const std::string_view text, std::size_t pos) {
  while (pos < text.size() && core::is_ascii_digit(text[pos])) {
    ++pos;
  }

  // Thousands groups: "1,000,000". A group must be exactly three digits.
  while (pos < text.size() && text[pos] == ',' && digits_at(text, pos + 1, 3) &&
         !digits_at(text, pos + 4, 1)) {
    pos += 4;
  }

  // Decimal part: "99.9"
  if (pos + 1 < text.size() && text[pos] == '.' && core::is_ascii_digit(text[pos + 1])) {
    ++pos;
    while (pos < text.size() && core::is_ascii_digit(text[pos])) {
      ++pos;
    }
  }

  return pos;
}

}  // namespace

ConstraintMatcher::ConstraintMatcher(std::vector<std::string> units) {
  std::set<std::string> seen;
  for (auto& unit : units) {
    auto normalized = core::normalize_ascii_lower(core::trim(unit));
    if (normalized.empty() || !seen.insert(normalized).second) {
      continue;
    }
    units_.push_back(std::move(normalized));
  }

  units_longest_first_ = units_;
  std::stable_sort(units_longest_first_.begin(), units_longest_first_.end(),
                   [](const std::string& a, const std::string& b) { return a.size() > b.size(); });
}

std::optional<std::string> ConstraintMatcher::unit_at(const std::string_view lowered,
                                                      const std::size_t pos) const {
  const std::string_view rest = lowered.substr(pos);
  for (const auto& unit : units_longest_first_) {
    if (!rest.starts_with(unit)) {
      continue;
    }
    // A unit that ends in a symbol ("%") needs no boundary after it;
    // a word unit must not run on into a longer word ("sec" in "secure").
    const std::size_t after = pos + unit.size();
    const bool ends_with_word_char = core::is_ascii_alnum(unit.back());
    if (ends_with_word_char && after < lowered.size() && core::is_ascii_alnum(lowered[after])) {
      continue;
    }
    return unit;
  }
  return std::nullopt;
}

std::optional<ConstraintMatch> ConstraintMatcher::find_first(const std::string_view text) const {
  if (units_.empty()) {
    return std::nullopt;
  }

  const std::string lowered = core::normalize_ascii_lower(text);

  std::size_t i = 0;
  while (i < lowered.size()) {
    if (!core::is_ascii_digit(lowered[i])) {
      ++i;
      continue;
    }

    // A number glued to a preceding word ("v2", "ipv6") is not a quantity.
    const bool glued = i > 0 && core::is_ascii_alnum(lowered[i - 1]);
    const std::size_t number_end = scan_number(lowered, i);
    if (glued) {
      i = number_end;
      continue;
    }

    std::size_t unit_start = number_end;
    while (unit_start < lowered.size() && (lowered[unit_start] == ' ' || lowered[unit_start] == '\t')) {
      ++unit_start;
    }

    if (auto unit = unit_at(lowered, unit_start)) {
      ConstraintMatch match;
      match.span = core::TextSpan{i, unit_start + unit->size()};
      match.text = std::string(text.substr(match.span.begin, match.span.length()));
      match.unit = std::move(*unit);
      return match;
    }

    i = number_end;
  }

  return std::nullopt;
}

}  // namespace rqcd::lexicon
