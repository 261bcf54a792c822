#include "rqcd/lexicon/lexicon.h"

#include "rqcd/core/normalization.h"

#include <set>
#include <utility>

namespace rqcd::lexicon {

namespace {

std::vector<std::string> normalize_terms(std::vector<std::string> terms) {
  std::vector<std::string> result;
  std::set<std::string> seen;
  for (auto& term : terms) {
    auto normalized = core::normalize_ascii_lower(core::trim(term));
    if (normalized.empty() || !seen.insert(normalized).second) {
      continue;
    }
    result.push_back(std::move(normalized));
  }
  return result;
}

}  // namespace

Lexicon::Lexicon(std::vector<std::string> vague_terms, std::vector<std::string> units,
                 const PhraseMatchMode match_mode)
    : vague_terms_(normalize_terms(std::move(vague_terms))),
      constraint_matcher_(std::move(units)),
      match_mode_(match_mode) {}

std::vector<core::TextSpan> Lexicon::find_occurrences(const std::string_view lowered,
                                                      const std::string_view term) const {
  std::vector<core::TextSpan> spans;

  std::size_t pos = lowered.find(term);
  while (pos != std::string_view::npos) {
    const std::size_t end = pos + term.size();
    bool accepted = true;
    if (match_mode_ == PhraseMatchMode::kWordBoundary) {
      const bool left_ok = pos == 0 || !core::is_ascii_alnum(lowered[pos - 1]);
      const bool right_ok = end == lowered.size() || !core::is_ascii_alnum(lowered[end]);
      accepted = left_ok && right_ok;
    }

    if (accepted) {
      spans.push_back(core::TextSpan{pos, end});
      pos = lowered.find(term, end);
    } else {
      pos = lowered.find(term, pos + 1);
    }
  }

  return spans;
}

std::vector<VagueTermMatch> Lexicon::find_vague_terms(const std::string_view text) const {
  std::vector<VagueTermMatch> matches;
  if (text.empty()) {
    return matches;
  }

  // Lowercasing is byte-for-byte, so offsets in `lowered` are offsets in `text`.
  const std::string lowered = core::normalize_ascii_lower(text);

  for (const auto& term : vague_terms_) {
    auto spans = find_occurrences(lowered, term);
    if (!spans.empty()) {
      matches.push_back(VagueTermMatch{term, std::move(spans)});
    }
  }

  return matches;
}

std::vector<std::string> default_vague_terms() {
  return {"fast",   "quick",  "efficient", "user-friendly", "secure",   "many",    "large",
          "simple", "easy",   "robust",    "scalable",      "flexible", "reliable"};
}

std::vector<std::string> default_units() {
  return {
      // Time
      "ms", "millisecond", "milliseconds", "sec", "secs", "second", "seconds", "min", "mins",
      "minute", "minutes", "hr", "hrs", "hour", "hours", "day", "days",
      // Quantity and rate
      "user", "users", "request", "requests", "record", "records", "transaction",
      "transactions", "connection", "connections", "rps", "tps", "qps",
      // Data size
      "kb", "mb", "gb", "tb",
      // Percentage
      "%", "percent"};
}

Lexicon default_lexicon() {
  return Lexicon(default_vague_terms(), default_units());
}

}  // namespace rqcd::lexicon
