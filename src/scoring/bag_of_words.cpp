#include "rqcd/scoring/bag_of_words.h"

#include "rqcd/core/normalization.h"

#include <map>
#include <set>
#include <utility>

namespace rqcd::scoring {

std::vector<std::string> feature_tokens(const std::string_view text) {
  return core::tokenize_ascii(text, 2);
}

BagOfWords::BagOfWords(std::vector<std::string> sorted_terms) : terms_(std::move(sorted_terms)) {
  index_.reserve(terms_.size());
  for (std::size_t i = 0; i < terms_.size(); ++i) {
    index_.emplace(terms_[i], i);
  }
}

BagOfWords BagOfWords::fit(const std::vector<std::string>& documents) {
  std::set<std::string> vocabulary;
  for (const auto& document : documents) {
    auto tokens = feature_tokens(document);
    vocabulary.insert(tokens.begin(), tokens.end());
  }
  return BagOfWords(std::vector<std::string>(vocabulary.begin(), vocabulary.end()));
}

std::optional<std::size_t> BagOfWords::index_of(const std::string_view term) const {
  const auto it = index_.find(std::string(term));
  if (it == index_.end()) {
    return std::nullopt;
  }
  return it->second;
}

SparseVector BagOfWords::vectorize(const std::string_view text) const {
  // std::map keeps indices ascending.
  std::map<std::size_t, double> counts;
  for (const auto& token : feature_tokens(text)) {
    const auto it = index_.find(token);
    if (it != index_.end()) {
      counts[it->second] += 1.0;
    }
  }
  return SparseVector(counts.begin(), counts.end());
}

}  // namespace rqcd::scoring
