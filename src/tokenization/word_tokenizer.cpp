#include "rqcd/tokenization/word_tokenizer.h"

#include "rqcd/core/normalization.h"

namespace rqcd::tokenization {

namespace {

bool is_joiner(const char ch) {
  return ch == '-' || ch == '\'';
}

}  // namespace

std::vector<std::string> WordTokenizer::tokenize(const std::string_view text) const {
  std::vector<std::string> tokens;
  std::string current;

  for (std::size_t i = 0; i < text.size(); ++i) {
    const char ch = text[i];
    if (core::is_ascii_alnum(ch)) {
      current.push_back(ch);
      continue;
    }

    // Keep the joiner only when it sits between two alphanumeric runs.
    const bool joins = is_joiner(ch) && !current.empty() && i + 1 < text.size() &&
                       core::is_ascii_alnum(text[i + 1]);
    if (joins) {
      current.push_back(ch);
      continue;
    }

    if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }

  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }

  return tokens;
}

}  // namespace rqcd::tokenization
