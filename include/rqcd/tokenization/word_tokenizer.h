#pragma once

#include "rqcd/tokenization/tokenization_provider.h"

namespace rqcd::tokenization {

/// Deterministic word tokenizer (no external resources).
/// Rules:
/// - A token is a maximal run of ASCII letters and digits
/// - A single '-' or '\'' between two alphanumeric runs joins them
///   ("user-friendly", "don't", "real-time" are one token each)
/// - Everything else (punctuation, whitespace, non-ASCII bytes) separates tokens
/// - Original case is preserved
class WordTokenizer final : public ITokenizationProvider {
 public:
  WordTokenizer() = default;

  [[nodiscard]] std::string_view id() const noexcept override { return "word-v1"; }
  [[nodiscard]] core::Result<bool, std::string> prepare() override {
    return core::Result<bool, std::string>::ok(true);
  }
  [[nodiscard]] std::vector<std::string> tokenize(std::string_view text) const override;
};

}  // namespace rqcd::tokenization
