#pragma once

#include "rqcd/tokenization/tokenization_provider.h"

namespace rqcd::tokenization {

/// Fallback tokenizer: splits on ASCII whitespace only, punctuation stays attached.
/// Counts differ from WordTokenizer ("fast," vs "fast"), so using it is a
/// reported degradation, never a silent substitute.
class WhitespaceTokenizer final : public ITokenizationProvider {
 public:
  WhitespaceTokenizer() = default;

  [[nodiscard]] std::string_view id() const noexcept override { return "whitespace-v1"; }
  [[nodiscard]] core::Result<bool, std::string> prepare() override {
    return core::Result<bool, std::string>::ok(true);
  }
  [[nodiscard]] std::vector<std::string> tokenize(std::string_view text) const override;
};

}  // namespace rqcd::tokenization
