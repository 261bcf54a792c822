#include "rqcd/scoring/bag_of_words.h"
#include "rqcd/scoring/logistic_regression.h"
#include "rqcd/scoring/training_corpus.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace rqcd;
using Catch::Approx;

namespace {

struct Fixture {
  scoring::BagOfWords bow;
  std::vector<scoring::SparseVector> rows;
  std::vector<int> labels;
};

Fixture embedded_fixture() {
  const auto corpus = scoring::embedded_training_corpus();
  std::vector<std::string> docs;
  std::vector<int> labels;
  for (const auto& ex : corpus) {
    docs.push_back(ex.text);
    labels.push_back(ex.label);
  }
  auto bow = scoring::BagOfWords::fit(docs);
  std::vector<scoring::SparseVector> rows;
  for (const auto& d : docs) {
    rows.push_back(bow.vectorize(d));
  }
  return Fixture{std::move(bow), std::move(rows), std::move(labels)};
}

}  // namespace

TEST_CASE("sigmoid is stable at the extremes", "[scoring][lr]") {
  CHECK(scoring::sigmoid(0.0) == Approx(0.5));
  CHECK(scoring::sigmoid(800.0) == Approx(1.0));
  CHECK(scoring::sigmoid(-800.0) == Approx(0.0));
  CHECK(scoring::sigmoid(-800.0) >= 0.0);
}

TEST_CASE("training is deterministic", "[scoring][lr]") {
  const auto f = embedded_fixture();
  const scoring::LogisticRegressionTrainer trainer;

  const auto a = trainer.fit(f.rows, f.labels, f.bow.size());
  const auto b = trainer.fit(f.rows, f.labels, f.bow.size());

  CHECK(a.weights == b.weights);
  CHECK(a.bias == b.bias);
  CHECK(a.iterations == b.iterations);
}

TEST_CASE("training on the built-in corpus converges", "[scoring][lr]") {
  const auto f = embedded_fixture();
  const auto model = scoring::LogisticRegressionTrainer{}.fit(f.rows, f.labels, f.bow.size());

  CHECK(model.converged);
  CHECK(model.iterations < 10000);
  CHECK(model.weights.size() == f.bow.size());
  CHECK(model.weights[*f.bow.index_of("and")] == Approx(0.58).margin(0.01));
  CHECK(model.weights[*f.bow.index_of("seconds")] < 0.0);
  CHECK(model.bias == Approx(-0.227).margin(0.01));

  // Every training example lands on its own side of 0.5
  for (std::size_t i = 0; i < f.rows.size(); ++i) {
    const double p = scoring::sigmoid(scoring::decision_function(model, f.rows[i]));
    CHECK((p > 0.5) == (f.labels[i] == scoring::kUnclearLabel));
  }
}

TEST_CASE("iteration cap stops training", "[scoring][lr]") {
  const auto f = embedded_fixture();
  scoring::TrainerOptions options;
  options.max_iterations = 3;
  const auto model = scoring::LogisticRegressionTrainer(options).fit(f.rows, f.labels, f.bow.size());
  CHECK(model.iterations == 3);
  CHECK_FALSE(model.converged);
}
