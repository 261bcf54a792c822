#include "rqcd/scoring/logistic_regression.h"

#include <cmath>

namespace rqcd::scoring {

double sigmoid(const double z) noexcept {
  if (z >= 0.0) {
    return 1.0 / (1.0 + std::exp(-z));
  }
  const double e = std::exp(z);
  return e / (1.0 + e);
}

double decision_function(const LinearModel& model, const SparseVector& x) noexcept {
  double z = model.bias;
  for (const auto& [index, value] : x) {
    z += model.weights[index] * value;
  }
  return z;
}

LogisticRegressionTrainer::LogisticRegressionTrainer(const TrainerOptions options)
    : options_(options) {}

LinearModel LogisticRegressionTrainer::fit(const std::vector<SparseVector>& rows,
                                           const std::vector<int>& labels,
                                           const std::size_t feature_count) const {
  LinearModel model;
  model.weights.assign(feature_count, 0.0);

  std::vector<double> gradient(feature_count, 0.0);
  const double inverse_c = 1.0 / options_.l2_c;

  for (std::size_t iteration = 0; iteration < options_.max_iterations; ++iteration) {
    // Regularization term, then the data term row by row.
    for (std::size_t j = 0; j < feature_count; ++j) {
      gradient[j] = model.weights[j] * inverse_c;
    }
    double bias_gradient = 0.0;

    for (std::size_t i = 0; i < rows.size(); ++i) {
      const double residual = sigmoid(decision_function(model, rows[i])) -
                              static_cast<double>(labels[i]);
      for (const auto& [index, value] : rows[i]) {
        gradient[index] += residual * value;
      }
      bias_gradient += residual;
    }

    double norm_sq = bias_gradient * bias_gradient;
    for (const double g : gradient) {
      norm_sq += g * g;
    }

    for (std::size_t j = 0; j < feature_count; ++j) {
      model.weights[j] -= options_.learning_rate * gradient[j];
    }
    model.bias -= options_.learning_rate * bias_gradient;
    model.iterations = iteration + 1;

    if (std::sqrt(norm_sq) < options_.tolerance) {
      model.converged = true;
      break;
    }
  }

  return model;
}

}  // namespace rqcd::scoring
