#pragma once

#include "rqcd/core/result.h"
#include "rqcd/scoring/bag_of_words.h"
#include "rqcd/scoring/logistic_regression.h"
#include "rqcd/scoring/training_corpus.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace rqcd::scoring {

// Weights with smaller magnitude than this count as zero when explaining a score.
constexpr double kNegligibleWeight = 1e-6;

struct WordWeight {
  std::string word;
  double weight{0.0};  // > 0 pushes toward unclear, < 0 toward clear

  bool operator==(const WordWeight&) const = default;
};

struct ClassifierResult {
  double probability{0.0};           // P(unclear), in [0, 1]
  std::vector<WordWeight> top_words;  // Text-present vocabulary terms, by descending |weight|

  bool operator==(const ClassifierResult&) const = default;
};

// StatisticalScorer is a bag-of-words logistic regression trained once, at startup,
// on a small labeled corpus. Immutable after train(); score() is const and thread-safe.
class StatisticalScorer {
 public:
  // Fails with kDegenerateTrainingData on an empty corpus, a label outside {0, 1},
  // a single-class corpus, or a corpus without any feature token.
  [[nodiscard]] static core::Result<StatisticalScorer, core::InitError> train(
      const TrainingCorpus& corpus, const TrainerOptions& options = TrainerOptions{});

  // Probability plus the top_k most influential words that occur in text.
  [[nodiscard]] ClassifierResult score(std::string_view text, std::size_t top_k) const;

  [[nodiscard]] double predict_unclear(std::string_view text) const;

  [[nodiscard]] const BagOfWords& vocabulary() const noexcept { return vocabulary_; }
  [[nodiscard]] const LinearModel& model() const noexcept { return model_; }

  // Trained weight for a vocabulary term; 0.0 for out-of-vocabulary words.
  [[nodiscard]] double weight_of(std::string_view term) const;

 private:
  StatisticalScorer(BagOfWords vocabulary, LinearModel model);

  BagOfWords vocabulary_;
  LinearModel model_;
};

}  // namespace rqcd::scoring
