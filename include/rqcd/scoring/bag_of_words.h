#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rqcd::scoring {

// (feature index, count), ascending by index, counts > 0.
using SparseVector = std::vector<std::pair<std::size_t, double>>;

// feature_tokens is the term extraction rule shared by training and inference:
// lower-case, split on non-alphanumerics, keep tokens of two or more characters.
// Single-character tokens ("2", "a") never become features.
[[nodiscard]] std::vector<std::string> feature_tokens(std::string_view text);

// BagOfWords maps vocabulary terms to feature indices (lexicographic order) and turns
// text into count vectors. Out-of-vocabulary tokens are ignored.
class BagOfWords {
 public:
  // Vocabulary = every distinct feature token across the documents.
  [[nodiscard]] static BagOfWords fit(const std::vector<std::string>& documents);

  [[nodiscard]] const std::vector<std::string>& terms() const noexcept { return terms_; }
  [[nodiscard]] std::size_t size() const noexcept { return terms_.size(); }
  [[nodiscard]] std::optional<std::size_t> index_of(std::string_view term) const;

  [[nodiscard]] SparseVector vectorize(std::string_view text) const;

 private:
  explicit BagOfWords(std::vector<std::string> sorted_terms);

  std::vector<std::string> terms_;
  std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace rqcd::scoring
