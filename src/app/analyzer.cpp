#include "rqcd/app/analyzer.h"

#include "rqcd/core/normalization.h"
#include "rqcd/tokenization/whitespace_tokenizer.h"
#include "rqcd/tokenization/word_tokenizer.h"
#include "rqcd/verdict/aggregator.h"
#include "rqcd/verdict/explainability.h"

#include <cmath>
#include <exception>
#include <iostream>
#include <utility>

namespace rqcd::app {

namespace {

core::InitError make_init_error(const core::InitErrorCode code, std::string message) {
  return core::InitError{code, std::move(message)};
}

}  // namespace

std::string validate_trainer_options(const scoring::TrainerOptions& options) {
  if (!std::isfinite(options.learning_rate) || options.learning_rate <= 0.0) {
    return "trainer.learning_rate must be > 0";
  }
  if (options.max_iterations < 1) {
    return "trainer.max_iterations must be at least 1";
  }
  if (!std::isfinite(options.tolerance) || options.tolerance < 0.0) {
    return "trainer.tolerance must be >= 0";
  }
  if (!std::isfinite(options.l2_c) || options.l2_c <= 0.0) {
    return "trainer.l2_c must be > 0";
  }
  return "";
}

core::Result<std::shared_ptr<const Analyzer>, core::InitError> Analyzer::initialize(
    AnalyzerConfig config, std::unique_ptr<tokenization::ITokenizationProvider> tokenizer) {
  using InitResult = core::Result<std::shared_ptr<const Analyzer>, core::InitError>;

  // 1. Configuration
  if (auto problem = verdict::validate_thresholds(config.thresholds); !problem.empty()) {
    return InitResult::err(make_init_error(core::InitErrorCode::kInvalidConfig, problem));
  }
  if (auto problem = validate_trainer_options(config.trainer); !problem.empty()) {
    return InitResult::err(make_init_error(core::InitErrorCode::kInvalidConfig, problem));
  }

  // 2. Tokenizer resources (once, eagerly)
  if (!tokenizer) {
    tokenizer = std::make_unique<tokenization::WordTokenizer>();
  }
  std::optional<std::string> degradation_notice;
  const auto prepared = tokenizer->prepare();
  if (!prepared.has_value()) {
    const std::string detail =
        "tokenizer '" + std::string(tokenizer->id()) + "' unavailable: " + prepared.error();
    if (config.tokenizer_policy == TokenizerFallbackPolicy::kFailClosed) {
      return InitResult::err(
          make_init_error(core::InitErrorCode::kTokenizerUnavailable, detail));
    }

    auto fallback = std::make_unique<tokenization::WhitespaceTokenizer>();
    const auto fallback_prepared = fallback->prepare();
    if (!fallback_prepared.has_value()) {
      return InitResult::err(make_init_error(core::InitErrorCode::kTokenizerUnavailable,
                                             detail + "; fallback failed: " +
                                                 fallback_prepared.error()));
    }
    degradation_notice = "Resource degradation: " + detail + "; using " +
                         std::string(fallback->id()) +
                         " tokenization, complexity counts may differ.";
    std::cerr << "Warning: " << *degradation_notice << "\n";
    tokenizer = std::move(fallback);
  }

  // 3. Classifier
  const scoring::TrainingCorpus corpus =
      config.training_corpus.has_value() ? *config.training_corpus
                                         : scoring::embedded_training_corpus();
  auto trained = scoring::StatisticalScorer::train(corpus, config.trainer);
  if (!trained.has_value()) {
    return InitResult::err(trained.error());
  }

  std::shared_ptr<const Analyzer> analyzer(
      new Analyzer(config.thresholds, std::move(config.lexicon), std::move(tokenizer),
                   trained.value(), std::move(degradation_notice)));
  return InitResult::ok(std::move(analyzer));
}

Analyzer::Analyzer(verdict::Thresholds thresholds, lexicon::Lexicon lexicon,
                   std::unique_ptr<tokenization::ITokenizationProvider> tokenizer,
                   scoring::StatisticalScorer scorer,
                   std::optional<std::string> degradation_notice)
    : thresholds_(thresholds),
      lexicon_(std::move(lexicon)),
      tokenizer_(std::move(tokenizer)),
      scorer_(std::move(scorer)),
      degradation_notice_(std::move(degradation_notice)),
      rule_engine_(lexicon_, *tokenizer_) {}

verdict::Verdict Analyzer::analyze_unchecked(const std::string_view text,
                                             const verdict::Thresholds& thresholds) const {
  const rules::RuleFindings findings = rule_engine_.analyze(text, thresholds.max_tokens);
  const scoring::ClassifierResult classifier = scorer_.score(text, thresholds.top_k);

  verdict::Verdict result = verdict::aggregate(text, findings, classifier, thresholds);
  result.explanation = verdict::build_explanation(classifier, findings.vague_matches);
  return result;
}

verdict::Verdict Analyzer::analyze(const std::string_view text,
                                   const verdict::ThresholdOverrides& overrides) const {
  verdict::Verdict result;

  if (core::is_blank(text)) {
    result = verdict::make_single_reason_verdict(text, verdict::ReasonTag::kEmptyInput,
                                                 "Empty requirement; nothing to analyze.");
  } else {
    const verdict::Thresholds effective = verdict::apply_overrides(thresholds_, overrides);
    if (auto problem = verdict::validate_thresholds(effective); !problem.empty()) {
      result = verdict::make_single_reason_verdict(
          text, verdict::ReasonTag::kAnalysisError, "Invalid threshold override: " + problem);
    } else {
      try {
        result = analyze_unchecked(text, effective);
      } catch (const std::exception& e) {
        result = verdict::make_single_reason_verdict(
            text, verdict::ReasonTag::kAnalysisError, std::string("Analysis failed: ") + e.what());
      }
    }
  }

  if (degradation_notice_.has_value()) {
    result.warnings.push_back(*degradation_notice_);
  }
  return result;
}

std::vector<verdict::Verdict> Analyzer::analyze_batch(
    const std::vector<std::string>& texts, const verdict::ThresholdOverrides& overrides) const {
  std::vector<verdict::Verdict> verdicts;
  verdicts.reserve(texts.size());
  for (const auto& text : texts) {
    verdicts.push_back(analyze(text, overrides));
  }
  return verdicts;
}

BatchSummary summarize(const std::vector<verdict::Verdict>& verdicts) {
  BatchSummary summary;
  for (const auto& v : verdicts) {
    if (v.has_tag(verdict::ReasonTag::kEmptyInput)) {
      ++summary.blank;
      continue;
    }
    ++summary.total;
    switch (v.status) {
      case verdict::ClarityStatus::kClear:
        ++summary.clear;
        break;
      case verdict::ClarityStatus::kPartiallyClear:
        ++summary.partially_clear;
        break;
      case verdict::ClarityStatus::kUnclear:
        ++summary.unclear;
        break;
    }
  }
  return summary;
}

}  // namespace rqcd::app
