#pragma once

#include "rqcd/scoring/bag_of_words.h"

#include <cstddef>
#include <vector>

namespace rqcd::scoring {

// TrainerOptions for full-batch gradient descent on the L2-regularized log loss:
//   J(w, b) = 0.5 * ||w||^2 / l2_c + sum_i logloss(sigmoid(w.x_i + b), y_i)
// The intercept b is not regularized. Training stops when the gradient norm drops
// below tolerance or after max_iterations steps.
struct TrainerOptions {
  double learning_rate{0.1};
  std::size_t max_iterations{10000};
  double tolerance{1e-8};
  double l2_c{1.0};
};

struct LinearModel {
  std::vector<double> weights;  // One per vocabulary term
  double bias{0.0};
  std::size_t iterations{0};
  bool converged{false};
};

// Numerically stable logistic function.
[[nodiscard]] double sigmoid(double z) noexcept;

// w.x + b for a sparse feature vector.
[[nodiscard]] double decision_function(const LinearModel& model, const SparseVector& x) noexcept;

// LogisticRegressionTrainer fits a binary linear classifier.
// Weights start at zero and the update order is fixed, so the same rows and labels
// always produce the same model.
class LogisticRegressionTrainer {
 public:
  explicit LogisticRegressionTrainer(TrainerOptions options = TrainerOptions{});

  // Preconditions (checked by the caller): rows.size() == labels.size(), labels in {0, 1},
  // every feature index < feature_count.
  [[nodiscard]] LinearModel fit(const std::vector<SparseVector>& rows,
                                const std::vector<int>& labels, std::size_t feature_count) const;

  [[nodiscard]] const TrainerOptions& options() const noexcept { return options_; }

 private:
  TrainerOptions options_;
};

}  // namespace rqcd::scoring
