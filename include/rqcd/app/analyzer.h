#pragma once

#include "rqcd/app/analyzer_config.h"
#include "rqcd/core/result.h"
#include "rqcd/lexicon/lexicon.h"
#include "rqcd/rules/rule_engine.h"
#include "rqcd/scoring/statistical_scorer.h"
#include "rqcd/tokenization/tokenization_provider.h"
#include "rqcd/verdict/thresholds.h"
#include "rqcd/verdict/verdict.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rqcd::app {

// Counts shown on the batch dashboard.
struct BatchSummary {
  std::size_t clear{0};            // NOLINT(readability-identifier-naming)
  std::size_t partially_clear{0};  // NOLINT(readability-identifier-naming)
  std::size_t unclear{0};          // NOLINT(readability-identifier-naming)
  std::size_t total{0};            // NOLINT(readability-identifier-naming)
  std::size_t blank{0};            // NOLINT(readability-identifier-naming)

  bool operator==(const BatchSummary&) const = default;
};

// Analyzer is the long-lived, read-only analysis handle.
//
// initialize() does all the expensive work once: validates thresholds, prepares the
// tokenizer and trains the classifier. The returned handle is immutable, so any number
// of threads may call analyze() on it concurrently. Several handles with different
// configurations can coexist.
class Analyzer {
 public:
  // tokenizer == nullptr selects WordTokenizer.
  // Errors:
  //   kInvalidConfig          - thresholds or trainer options out of range
  //   kTokenizerUnavailable   - prepare() failed and policy is kFailClosed
  //   kDegenerateTrainingData - the corpus cannot train a two-class model
  [[nodiscard]] static core::Result<std::shared_ptr<const Analyzer>, core::InitError> initialize(
      AnalyzerConfig config, std::unique_ptr<tokenization::ITokenizationProvider> tokenizer = nullptr);

  Analyzer(const Analyzer&) = delete;
  Analyzer& operator=(const Analyzer&) = delete;
  Analyzer(Analyzer&&) = delete;
  Analyzer& operator=(Analyzer&&) = delete;
  ~Analyzer() = default;

  // Never throws. Blank text yields a single EMPTY_INPUT reason; a failure inside the
  // pipeline (including invalid overrides) yields a single ANALYSIS_ERROR reason.
  [[nodiscard]] verdict::Verdict analyze(std::string_view text,
                                         const verdict::ThresholdOverrides& overrides = {}) const;

  // One verdict per input, same order; element i equals analyze(texts[i], overrides).
  [[nodiscard]] std::vector<verdict::Verdict> analyze_batch(
      const std::vector<std::string>& texts, const verdict::ThresholdOverrides& overrides = {}) const;

  [[nodiscard]] const verdict::Thresholds& thresholds() const noexcept { return thresholds_; }
  [[nodiscard]] const lexicon::Lexicon& lexicon() const noexcept { return lexicon_; }
  [[nodiscard]] const scoring::StatisticalScorer& scorer() const noexcept { return scorer_; }
  [[nodiscard]] std::string_view tokenizer_id() const noexcept { return tokenizer_->id(); }

  // Set when the analyzer runs on the fallback tokenizer.
  [[nodiscard]] const std::optional<std::string>& degradation_notice() const noexcept {
    return degradation_notice_;
  }

 private:
  Analyzer(verdict::Thresholds thresholds, lexicon::Lexicon lexicon,
           std::unique_ptr<tokenization::ITokenizationProvider> tokenizer,
           scoring::StatisticalScorer scorer, std::optional<std::string> degradation_notice);

  [[nodiscard]] verdict::Verdict analyze_unchecked(std::string_view text,
                                                   const verdict::Thresholds& thresholds) const;

  verdict::Thresholds thresholds_;
  lexicon::Lexicon lexicon_;
  std::unique_ptr<tokenization::ITokenizationProvider> tokenizer_;
  scoring::StatisticalScorer scorer_;
  std::optional<std::string> degradation_notice_;
  rules::RuleEngine rule_engine_;  // Refers to lexicon_ and *tokenizer_; declared after them
};

// summarize counts statuses. Blank statements (EMPTY_INPUT) are not requirements:
// they go to `blank` and are left out of `total` and the status counts.
[[nodiscard]] BatchSummary summarize(const std::vector<verdict::Verdict>& verdicts);

// validate_trainer_options returns "" when usable, otherwise the first problem found.
[[nodiscard]] std::string validate_trainer_options(const scoring::TrainerOptions& options);

}  // namespace rqcd::app
