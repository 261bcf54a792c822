#include "rqcd/verdict/aggregator.h"

#include "rqcd/core/normalization.h"

#include <iomanip>
#include <sstream>
#include <utility>

namespace rqcd::verdict {

namespace {

std::string format_probability(const double value) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << value;
  return oss.str();
}

void apply_reason_count(Verdict& verdict) {
  verdict.status = status_for_reason_count(verdict.reasons.size());
  verdict.severity = severity_for_reason_count(verdict.reasons.size());
}

}  // namespace

Verdict aggregate(const std::string_view text, const rules::RuleFindings& findings,
                  const scoring::ClassifierResult& classifier, const Thresholds& thresholds) {
  Verdict verdict;
  verdict.text = std::string(text);
  verdict.vague_matches = findings.vague_matches;
  verdict.has_constraint = findings.has_constraint;
  if (findings.first_constraint.has_value()) {
    verdict.constraint_evidence = findings.first_constraint->text;
  }
  verdict.is_complex = findings.is_complex;
  verdict.token_count = findings.token_count;
  verdict.classifier = classifier;

  if (!findings.vague_matches.empty()) {
    verdict.reasons.push_back(
        Reason{ReasonTag::kVagueTerms,
               "Vague terms detected: " + core::join(verdict.vague_terms(), ", ")});
  }

  if (!findings.has_constraint) {
    verdict.reasons.push_back(
        Reason{ReasonTag::kNoConstraints, "No measurable constraints provided."});
  }

  if (findings.is_complex) {
    verdict.reasons.push_back(Reason{
        ReasonTag::kComplexSentence,
        "Sentence too long or complex (" + std::to_string(findings.token_count) + " tokens > " +
            std::to_string(thresholds.max_tokens) + ")."});
  }

  if (classifier.probability > thresholds.ml_threshold) {
    verdict.reasons.push_back(
        Reason{ReasonTag::kMlAmbiguity, "ML model suggests possible ambiguity (p=" +
                                            format_probability(classifier.probability) + " > " +
                                            format_probability(thresholds.ml_threshold) + ")."});
  }

  apply_reason_count(verdict);
  return verdict;
}

Verdict make_single_reason_verdict(const std::string_view text, const ReasonTag tag,
                                   std::string message) {
  Verdict verdict;
  verdict.text = std::string(text);
  verdict.reasons.push_back(Reason{tag, std::move(message)});
  apply_reason_count(verdict);
  return verdict;
}

}  // namespace rqcd::verdict
