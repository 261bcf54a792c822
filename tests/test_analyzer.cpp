#include "rqcd/app/analyzer.h"
#include "rqcd/tokenization/tokenization_provider.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace rqcd;
using verdict::ClarityStatus;
using verdict::ReasonTag;

namespace {

std::shared_ptr<const app::Analyzer> default_analyzer() {
  auto result = app::Analyzer::initialize(app::AnalyzerConfig{});
  REQUIRE(result.has_value());
  return result.value();
}

// Tokenizer whose resources are never available.
class MissingResourceTokenizer final : public tokenization::ITokenizationProvider {
 public:
  [[nodiscard]] std::string_view id() const noexcept override { return "missing-v1"; }
  [[nodiscard]] core::Result<bool, std::string> prepare() override {
    return core::Result<bool, std::string>::err("model data not installed");
  }
  [[nodiscard]] std::vector<std::string> tokenize(std::string_view /*text*/) const override {
    return {};
  }
};

// Tokenizer that fails while analyzing one particular statement.
class ThrowingTokenizer final : public tokenization::ITokenizationProvider {
 public:
  [[nodiscard]] std::string_view id() const noexcept override { return "throwing-v1"; }
  [[nodiscard]] core::Result<bool, std::string> prepare() override {
    return core::Result<bool, std::string>::ok(true);
  }
  [[nodiscard]] std::vector<std::string> tokenize(std::string_view text) const override {
    if (text == "boom") {
      throw std::runtime_error("tokenizer exploded");
    }
    return {std::string(text)};
  }
};

}  // namespace

TEST_CASE("vague, unmeasurable statement is Unclear", "[analyzer][scenario]") {
  const auto analyzer = default_analyzer();
  const auto v = analyzer->analyze("The system shall be fast and scalable.");

  CHECK(v.status == ClarityStatus::kUnclear);
  CHECK(v.severity == 3);
  CHECK(v.vague_terms() == std::vector<std::string>{"fast", "scalable"});
  CHECK(v.has_tag(ReasonTag::kVagueTerms));
  CHECK(v.has_tag(ReasonTag::kNoConstraints));
  CHECK(v.has_tag(ReasonTag::kMlAmbiguity));
  CHECK_FALSE(v.has_tag(ReasonTag::kComplexSentence));
  CHECK(v.reasons.front().message == "Vague terms detected: fast, scalable");
  CHECK(v.classifier.probability == Catch::Approx(0.7743).margin(0.005));
  CHECK(v.explanation.highlight_spans == std::vector<core::TextSpan>{{20, 24}, {29, 37}});
  CHECK(v.warnings.empty());
}

TEST_CASE("measurable statement is Clear", "[analyzer][scenario]") {
  const auto analyzer = default_analyzer();
  const auto v = analyzer->analyze("The system shall respond in under 2 seconds.");

  CHECK(v.status == ClarityStatus::kClear);
  CHECK(v.severity == 1);
  CHECK(v.reasons.empty());
  CHECK(v.has_constraint);
  CHECK(v.constraint_evidence == std::optional<std::string>{"2 seconds"});
  CHECK(v.classifier.probability < 0.6);
}

TEST_CASE("user-friendly UI is Unclear", "[analyzer][scenario]") {
  const auto analyzer = default_analyzer();
  const auto v = analyzer->analyze("The UI should be user-friendly.");

  CHECK(v.status == ClarityStatus::kUnclear);
  CHECK(v.vague_terms() == std::vector<std::string>{"user-friendly"});
  CHECK(v.has_tag(ReasonTag::kNoConstraints));
}

TEST_CASE("statement with a user count is Clear", "[analyzer][scenario]") {
  const auto analyzer = default_analyzer();
  const auto v = analyzer->analyze("The app must handle 500 users without errors.");

  CHECK(v.status == ClarityStatus::kClear);
  CHECK(v.constraint_evidence == std::optional<std::string>{"500 users"});
}

TEST_CASE("one issue is Partially Clear", "[analyzer][scenario]") {
  const auto analyzer = default_analyzer();
  const auto v = analyzer->analyze("Users can export reports.");

  CHECK(v.status == ClarityStatus::kPartiallyClear);
  CHECK(v.severity == 2);
  REQUIRE(v.reasons.size() == 1);
  CHECK(v.reasons[0].tag == ReasonTag::kNoConstraints);
}

TEST_CASE("long sentence is flagged complex", "[analyzer][scenario]") {
  const auto analyzer = default_analyzer();
  const auto v = analyzer->analyze(
      "The service must process 100 requests per second and store every record in the "
      "archive database for the audit team each night.");

  CHECK(v.is_complex);
  CHECK(v.token_count == 22);
  REQUIRE(v.reasons.size() == 1);
  CHECK(v.reasons[0].message == "Sentence too long or complex (22 tokens > 20).");
  CHECK(v.status == ClarityStatus::kPartiallyClear);
}

TEST_CASE("blank input yields a single EMPTY_INPUT reason", "[analyzer][policy]") {
  const auto analyzer = default_analyzer();
  for (const std::string text : {"", "   ", "\t\n"}) {
    const auto v = analyzer->analyze(text);
    REQUIRE(v.reasons.size() == 1);
    CHECK(v.reasons[0].tag == ReasonTag::kEmptyInput);
    CHECK(v.status == ClarityStatus::kPartiallyClear);
    CHECK(v.severity == 2);
    CHECK(v.classifier.top_words.empty());
  }
}

TEST_CASE("batch preserves order and matches single analysis", "[analyzer][batch]") {
  const auto analyzer = default_analyzer();
  const std::vector<std::string> texts{"The system shall be fast and scalable.", "",
                                       "The system shall respond in under 2 seconds.",
                                       "Users can export reports."};

  const auto verdicts = analyzer->analyze_batch(texts);
  REQUIRE(verdicts.size() == texts.size());
  for (std::size_t i = 0; i < texts.size(); ++i) {
    CHECK(verdicts[i].text == texts[i]);
    CHECK(verdicts[i] == analyzer->analyze(texts[i]));
  }

  const auto summary = app::summarize(verdicts);
  CHECK(summary == app::BatchSummary{1, 1, 1, 3, 1});
  CHECK(analyzer->analyze_batch({}).empty());
}

TEST_CASE("per-call overrides change only that call", "[analyzer][thresholds]") {
  const auto analyzer = default_analyzer();
  const std::string text = "Users can export reports.";

  verdict::ThresholdOverrides strict;
  strict.ml_threshold = 0.3;
  strict.max_tokens = 3;
  strict.top_k = 1;

  const auto v = analyzer->analyze(text, strict);
  CHECK(v.has_tag(ReasonTag::kMlAmbiguity));
  CHECK(v.has_tag(ReasonTag::kComplexSentence));
  CHECK(v.reasons[1].message == "Sentence too long or complex (4 tokens > 3).");
  CHECK(v.status == ClarityStatus::kUnclear);

  CHECK(analyzer->analyze(text).status == ClarityStatus::kPartiallyClear);
  CHECK(analyzer->thresholds() == verdict::Thresholds{});

  const auto limited = analyzer->analyze("The system shall be fast and scalable.", strict);
  CHECK(limited.classifier.top_words.size() == 1);
}

TEST_CASE("invalid overrides yield ANALYSIS_ERROR", "[analyzer][thresholds]") {
  const auto analyzer = default_analyzer();
  verdict::ThresholdOverrides bad;
  bad.ml_threshold = 1.5;
  const auto v = analyzer->analyze("Users can export reports.", bad);
  REQUIRE(v.reasons.size() == 1);
  CHECK(v.reasons[0].tag == ReasonTag::kAnalysisError);
}

TEST_CASE("initialization validates configuration", "[analyzer][init]") {
  SECTION("bad threshold") {
    app::AnalyzerConfig config;
    config.thresholds.max_tokens = 0;
    const auto result = app::Analyzer::initialize(config);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == core::InitErrorCode::kInvalidConfig);
  }

  SECTION("bad trainer option") {
    app::AnalyzerConfig config;
    config.trainer.learning_rate = 0.0;
    const auto result = app::Analyzer::initialize(config);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == core::InitErrorCode::kInvalidConfig);
  }

  SECTION("single-class corpus") {
    app::AnalyzerConfig config;
    config.training_corpus = scoring::TrainingCorpus{{"fast", 1}, {"robust", 1}};
    const auto result = app::Analyzer::initialize(config);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == core::InitErrorCode::kDegenerateTrainingData);
  }
}

TEST_CASE("missing tokenizer fails closed by default", "[analyzer][degradation]") {
  const auto result = app::Analyzer::initialize(app::AnalyzerConfig{},
                                                std::make_unique<MissingResourceTokenizer>());
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == core::InitErrorCode::kTokenizerUnavailable);
  CHECK(result.error().message.find("model data not installed") != std::string::npos);
}

TEST_CASE("whitespace fallback warns on every verdict", "[analyzer][degradation]") {
  app::AnalyzerConfig config;
  config.tokenizer_policy = app::TokenizerFallbackPolicy::kDegradeToWhitespace;
  const auto result =
      app::Analyzer::initialize(config, std::make_unique<MissingResourceTokenizer>());
  REQUIRE(result.has_value());
  const auto& analyzer = result.value();

  CHECK(analyzer->tokenizer_id() == "whitespace-v1");
  REQUIRE(analyzer->degradation_notice().has_value());

  const auto v = analyzer->analyze("The system shall be fast and scalable.");
  REQUIRE(v.warnings.size() == 1);
  CHECK(v.warnings[0] == *analyzer->degradation_notice());
  CHECK(v.token_count == 7);

  CHECK(analyzer->analyze("").warnings.size() == 1);
}

TEST_CASE("a failing statement does not abort the batch", "[analyzer][policy]") {
  const auto result =
      app::Analyzer::initialize(app::AnalyzerConfig{}, std::make_unique<ThrowingTokenizer>());
  REQUIRE(result.has_value());

  const auto verdicts = result.value()->analyze_batch({"fine", "boom", "fine again"});
  REQUIRE(verdicts.size() == 3);
  REQUIRE(verdicts[1].reasons.size() == 1);
  CHECK(verdicts[1].reasons[0].tag == ReasonTag::kAnalysisError);
  CHECK(verdicts[1].reasons[0].message.find("tokenizer exploded") != std::string::npos);
  CHECK_FALSE(verdicts[0].has_tag(ReasonTag::kAnalysisError));
  CHECK_FALSE(verdicts[2].has_tag(ReasonTag::kAnalysisError));
}

TEST_CASE("independently configured analyzers coexist", "[analyzer]") {
  app::AnalyzerConfig strict_config;
  strict_config.thresholds.ml_threshold = 0.1;
  const auto strict = app::Analyzer::initialize(strict_config);
  REQUIRE(strict.has_value());
  const auto lenient = default_analyzer();

  const std::string text = "The system shall respond in under 2 seconds.";
  CHECK(strict.value()->analyze(text).has_tag(ReasonTag::kMlAmbiguity));
  CHECK(lenient->analyze(text).status == ClarityStatus::kClear);
}

TEST_CASE("concurrent analysis matches sequential analysis", "[analyzer][concurrency]") {
  const auto analyzer = default_analyzer();
  const std::vector<std::string> texts{"The system shall be fast and scalable.",
                                       "The app must handle 500 users without errors.",
                                       "The UI should be user-friendly.", "Users can export reports."};
  const auto expected = analyzer->analyze_batch(texts);

  std::vector<std::vector<verdict::Verdict>> results(4);
  std::vector<std::thread> workers;
  for (std::size_t t = 0; t < results.size(); ++t) {
    workers.emplace_back([&, t] { results[t] = analyzer->analyze_batch(texts); });
  }
  for (auto& w : workers) {
    w.join();
  }
  for (const auto& r : results) {
    CHECK(r == expected);
  }
}
