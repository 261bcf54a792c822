#pragma once

#include "rqcd/lexicon/lexicon.h"
#include "rqcd/scoring/logistic_regression.h"
#include "rqcd/scoring/training_corpus.h"
#include "rqcd/verdict/thresholds.h"

#include <optional>
#include <string_view>

namespace rqcd::app {

// What to do when the primary tokenizer cannot prepare its resources.
enum class TokenizerFallbackPolicy {
  kFailClosed,           // Initialization fails with kTokenizerUnavailable
  kDegradeToWhitespace,  // Use WhitespaceTokenizer and warn on every verdict
};

[[nodiscard]] constexpr std::string_view to_string(const TokenizerFallbackPolicy policy) noexcept {
  switch (policy) {
    case TokenizerFallbackPolicy::kFailClosed:
      return "fail_closed";
    case TokenizerFallbackPolicy::kDegradeToWhitespace:
      return "whitespace";
  }
  return "unknown";
}

// AnalyzerConfig is everything an Analyzer handle is built from.
// Defaults reproduce the stock detector: built-in lexicon and corpus, 20 tokens,
// threshold 0.6, top 5 words.
struct AnalyzerConfig {
  verdict::Thresholds thresholds;                         // NOLINT(readability-identifier-naming)
  std::optional<scoring::TrainingCorpus> training_corpus;  // NOLINT(readability-identifier-naming)
  lexicon::Lexicon lexicon{lexicon::default_lexicon()};   // NOLINT(readability-identifier-naming)
  TokenizerFallbackPolicy tokenizer_policy{
      TokenizerFallbackPolicy::kFailClosed};  // NOLINT(readability-identifier-naming)
  scoring::TrainerOptions trainer;            // NOLINT(readability-identifier-naming)
};

}  // namespace rqcd::app
