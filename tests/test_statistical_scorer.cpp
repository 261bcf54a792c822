#include "rqcd/scoring/bag_of_words.h"
#include "rqcd/scoring/statistical_scorer.h"
#include "rqcd/scoring/training_corpus.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cmath>

using namespace rqcd;
using Catch::Approx;

namespace {

scoring::StatisticalScorer trained_scorer() {
  auto result = scoring::StatisticalScorer::train(scoring::embedded_training_corpus());
  REQUIRE(result.has_value());
  return result.value();
}

}  // namespace

TEST_CASE("scorer reproduces the reference probabilities", "[scoring]") {
  const auto scorer = trained_scorer();
  CHECK(scorer.predict_unclear("The system shall be fast and scalable.") ==
        Approx(0.7743).margin(0.005));
  CHECK(scorer.predict_unclear("The UI should be user-friendly.") == Approx(0.70).margin(0.005));
  CHECK(scorer.predict_unclear("The system shall respond in under 2 seconds.") ==
        Approx(0.2027).margin(0.005));
  CHECK(scorer.predict_unclear("The app must handle 500 users without errors.") ==
        Approx(0.3969).margin(0.005));
}

TEST_CASE("out-of-vocabulary text scores the bias alone", "[scoring]") {
  const auto scorer = trained_scorer();
  const auto result = scorer.score("Users can export reports.", 5);
  CHECK(result.probability == Approx(scoring::sigmoid(scorer.model().bias)));
  CHECK(result.top_words.empty());
  CHECK(scorer.score("", 5).probability == Approx(result.probability));
}

TEST_CASE("explained words are a subset of the text, ordered by magnitude", "[scoring]") {
  const auto scorer = trained_scorer();
  const std::string text = "The system shall be fast and scalable.";
  const auto result = scorer.score(text, 10);
  const auto tokens = scoring::feature_tokens(text);

  REQUIRE_FALSE(result.top_words.empty());
  for (const auto& w : result.top_words) {
    CHECK(std::find(tokens.begin(), tokens.end(), w.word) != tokens.end());
    CHECK(std::abs(w.weight) >= scoring::kNegligibleWeight);
    CHECK(w.weight == scorer.weight_of(w.word));
  }
  for (std::size_t i = 1; i < result.top_words.size(); ++i) {
    CHECK(std::abs(result.top_words[i - 1].weight) >= std::abs(result.top_words[i].weight));
  }

  // "the" occurs in both classes equally and carries no weight
  const bool has_the = std::any_of(result.top_words.begin(), result.top_words.end(),
                                   [](const scoring::WordWeight& w) { return w.word == "the"; });
  CHECK_FALSE(has_the);

  CHECK(result.top_words[0].word == "and");
  CHECK(result.top_words[1].word == "be");
  CHECK(result.top_words[0].weight > 0.0);
}

TEST_CASE("top_k truncates the explanation", "[scoring]") {
  const auto scorer = trained_scorer();
  const std::string text = "The system shall be fast and scalable.";
  CHECK(scorer.score(text, 2).top_words.size() == 2);
  CHECK(scorer.score(text, 0).top_words.empty());
  CHECK(scorer.score(text, 2).probability == scorer.score(text, 5).probability);
}

TEST_CASE("degenerate corpora are rejected", "[scoring]") {
  const auto expect_degenerate = [](const scoring::TrainingCorpus& corpus) {
    const auto result = scoring::StatisticalScorer::train(corpus);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == core::InitErrorCode::kDegenerateTrainingData);
    CHECK_FALSE(result.error().message.empty());
  };

  SECTION("empty") { expect_degenerate({}); }
  SECTION("single class") {
    expect_degenerate({{"fast system", scoring::kUnclearLabel},
                       {"simple interface", scoring::kUnclearLabel}});
  }
  SECTION("bad label") {
    expect_degenerate({{"fast system", scoring::kUnclearLabel}, {"within 2 seconds", 7}});
  }
  SECTION("no feature tokens") {
    expect_degenerate({{"a b c", scoring::kUnclearLabel}, {"1 2 3", scoring::kClearLabel}});
  }
}

TEST_CASE("vocabulary is exposed for inspection", "[scoring]") {
  const auto scorer = trained_scorer();
  CHECK(scorer.vocabulary().index_of("scalable").has_value());
  CHECK(scorer.model().weights.size() == scorer.vocabulary().size());
  CHECK(scorer.weight_of("nonexistent") == 0.0);
}
