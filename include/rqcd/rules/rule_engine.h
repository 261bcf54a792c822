#pragma once

#include "rqcd/lexicon/lexicon.h"
#include "rqcd/rules/rule_findings.h"
#include "rqcd/tokenization/tokenization_provider.h"

#include <cstddef>
#include <string_view>

namespace rqcd::rules {

// RuleEngine applies the lexicon and the sentence-length heuristic to raw text.
// It holds references (not ownership); the Analyzer owns the lexicon and tokenizer and
// outlives the engine. analyze() is const and touches no shared mutable state.
class RuleEngine {
 public:
  RuleEngine(const lexicon::Lexicon& lexicon, const tokenization::ITokenizationProvider& tokenizer);

  // Vague-term scan, first-constraint lookup, and token count vs max_tokens.
  // is_complex means token_count > max_tokens.
  [[nodiscard]] RuleFindings analyze(std::string_view text, std::size_t max_tokens) const;

 private:
  const lexicon::Lexicon& lexicon_;
  const tokenization::ITokenizationProvider& tokenizer_;
};

}  // namespace rqcd::rules
