#include "rqcd/tokenization/whitespace_tokenizer.h"

#include "rqcd/core/normalization.h"

namespace rqcd::tokenization {

std::vector<std::string> WhitespaceTokenizer::tokenize(const std::string_view text) const {
  std::vector<std::string> tokens;
  std::string current;

  for (const char ch : text) {
    if (core::is_ascii_space(ch)) {
      if (!current.empty()) {
        tokens.push_back(std::move(current));
        current.clear();
      }
    } else {
      current.push_back(ch);
    }
  }

  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }

  return tokens;
}

}  // namespace rqcd::tokenization
