#include "rqcd/rules/rule_engine.h"

namespace rqcd::rules {

RuleEngine::RuleEngine(const lexicon::Lexicon& lexicon,
                       const tokenization::ITokenizationProvider& tokenizer)
    : lexicon_(lexicon), tokenizer_(tokenizer) {}

RuleFindings RuleEngine::analyze(const std::string_view text, const std::size_t max_tokens) const {
  RuleFindings findings;
  findings.max_tokens = max_tokens;

  findings.vague_matches = lexicon_.find_vague_terms(text);

  // Presence only: the first match is enough.
  findings.first_constraint = lexicon_.constraint_matcher().find_first(text);
  findings.has_constraint = findings.first_constraint.has_value();

  findings.token_count = tokenizer_.tokenize(text).size();
  findings.is_complex = findings.token_count > max_tokens;

  return findings;
}

}  // namespace rqcd::rules
