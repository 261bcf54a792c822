#include "rqcd/scoring/statistical_scorer.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace rqcd::scoring {

namespace {

using TrainResult = core::Result<StatisticalScorer, core::InitError>;

core::InitError degenerate(std::string message) {
  return core::InitError{core::InitErrorCode::kDegenerateTrainingData, std::move(message)};
}

}  // namespace

StatisticalScorer::StatisticalScorer(BagOfWords vocabulary, LinearModel model)
    : vocabulary_(std::move(vocabulary)), model_(std::move(model)) {}

core::Result<StatisticalScorer, core::InitError> StatisticalScorer::train(
    const TrainingCorpus& corpus, const TrainerOptions& options) {
  if (corpus.empty()) {
    return TrainResult::err(degenerate("training corpus is empty"));
  }

  std::size_t unclear = 0;
  std::vector<std::string> documents;
  std::vector<int> labels;
  documents.reserve(corpus.size());
  labels.reserve(corpus.size());

  for (std::size_t i = 0; i < corpus.size(); ++i) {
    const auto& example = corpus[i];
    if (example.label != kClearLabel && example.label != kUnclearLabel) {
      return TrainResult::err(degenerate("training example " + std::to_string(i) +
                                         " has label " + std::to_string(example.label) +
                                         " (expected 0 or 1)"));
    }
    if (example.label == kUnclearLabel) {
      ++unclear;
    }
    documents.push_back(example.text);
    labels.push_back(example.label);
  }

  if (unclear == 0 || unclear == corpus.size()) {
    return TrainResult::err(degenerate("training corpus has a single class (" +
                                       std::to_string(unclear) + " unclear of " +
                                       std::to_string(corpus.size()) + " examples)"));
  }

  auto vocabulary = BagOfWords::fit(documents);
  if (vocabulary.size() == 0) {
    return TrainResult::err(degenerate("training corpus yields an empty vocabulary"));
  }

  std::vector<SparseVector> rows;
  rows.reserve(documents.size());
  for (const auto& document : documents) {
    rows.push_back(vocabulary.vectorize(document));
  }

  const LogisticRegressionTrainer trainer(options);
  auto model = trainer.fit(rows, labels, vocabulary.size());

  return TrainResult::ok(StatisticalScorer(std::move(vocabulary), std::move(model)));
}

double StatisticalScorer::predict_unclear(const std::string_view text) const {
  return sigmoid(decision_function(model_, vocabulary_.vectorize(text)));
}

double StatisticalScorer::weight_of(const std::string_view term) const {
  const auto index = vocabulary_.index_of(term);
  return index.has_value() ? model_.weights[*index] : 0.0;
}

ClassifierResult StatisticalScorer::score(const std::string_view text,
                                          const std::size_t top_k) const {
  const SparseVector x = vocabulary_.vectorize(text);

  ClassifierResult result;
  result.probability = sigmoid(decision_function(model_, x));

  // Only features present in x are candidates, so every explained word was written by the user.
  std::vector<WordWeight> candidates;
  candidates.reserve(x.size());
  for (const auto& entry : x) {
    const std::size_t index = entry.first;
    const double weight = model_.weights[index];
    if (std::abs(weight) < kNegligibleWeight) {
      continue;
    }
    candidates.push_back(WordWeight{vocabulary_.terms()[index], weight});
  }

  // Descending |weight|; ties keep vocabulary (lexicographic) order.
  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const WordWeight& a, const WordWeight& b) {
                     return std::abs(a.weight) > std::abs(b.weight);
                   });

  if (candidates.size() > top_k) {
    candidates.resize(top_k);
  }
  result.top_words = std::move(candidates);

  return result;
}

}  // namespace rqcd::scoring
