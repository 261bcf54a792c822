#include "rqcd/verdict/aggregator.h"

#include <catch2/catch_test_macros.hpp>

using namespace rqcd;
using verdict::ClarityStatus;
using verdict::ReasonTag;

namespace {

rules::RuleFindings findings(bool vague, bool constraint, bool complex) {
  rules::RuleFindings f;
  if (vague) {
    f.vague_matches.push_back({"fast", {{0, 4}}});
    f.vague_matches.push_back({"scalable", {{9, 17}}});
  }
  f.has_constraint = constraint;
  if (constraint) {
    f.first_constraint = lexicon::ConstraintMatch{"2 seconds", "seconds", {20, 29}};
  }
  f.is_complex = complex;
  f.token_count = complex ? 25 : 7;
  f.max_tokens = 20;
  return f;
}

scoring::ClassifierResult classifier(double p) {
  return scoring::ClassifierResult{p, {{"and", 0.58}}};
}

}  // namespace

TEST_CASE("status and severity depend only on the reason count", "[verdict]") {
  CHECK(verdict::status_for_reason_count(0) == ClarityStatus::kClear);
  CHECK(verdict::status_for_reason_count(1) == ClarityStatus::kPartiallyClear);
  CHECK(verdict::status_for_reason_count(2) == ClarityStatus::kUnclear);
  CHECK(verdict::status_for_reason_count(4) == ClarityStatus::kUnclear);
  CHECK(verdict::severity_for_reason_count(0) == 1);
  CHECK(verdict::severity_for_reason_count(1) == 2);
  CHECK(verdict::severity_for_reason_count(2) == 3);
  CHECK(verdict::severity_for_reason_count(4) == 3);
}

TEST_CASE("aggregate emits reasons in fixed order with stock messages", "[verdict]") {
  const verdict::Thresholds t;
  const auto v = verdict::aggregate("fast and scalable", findings(true, false, true),
                                    classifier(0.7743), t);

  REQUIRE(v.reasons.size() == 4);
  CHECK(v.reasons[0] == verdict::Reason{ReasonTag::kVagueTerms,
                                        "Vague terms detected: fast, scalable"});
  CHECK(v.reasons[1] ==
        verdict::Reason{ReasonTag::kNoConstraints, "No measurable constraints provided."});
  CHECK(v.reasons[2] == verdict::Reason{ReasonTag::kComplexSentence,
                                        "Sentence too long or complex (25 tokens > 20)."});
  CHECK(v.reasons[3] == verdict::Reason{ReasonTag::kMlAmbiguity,
                                        "ML model suggests possible ambiguity (p=0.77 > 0.60)."});
  CHECK(v.status == ClarityStatus::kUnclear);
  CHECK(v.severity == 3);
  CHECK(v.tags() == std::vector<std::string>{"COMPLEX_SENTENCE", "ML_AMBIGUITY",
                                             "NO_CONSTRAINTS", "VAGUE_TERMS"});
}

TEST_CASE("aggregate with no issues is Clear", "[verdict]") {
  const auto v = verdict::aggregate("respond in 2 seconds", findings(false, true, false),
                                    classifier(0.2), verdict::Thresholds{});
  CHECK(v.reasons.empty());
  CHECK(v.status == ClarityStatus::kClear);
  CHECK(v.severity == 1);
  CHECK(v.has_constraint);
  CHECK(v.constraint_evidence == std::optional<std::string>{"2 seconds"});
  CHECK(v.tags().empty());
}

TEST_CASE("ML reason requires probability strictly above threshold", "[verdict]") {
  verdict::Thresholds t;
  t.ml_threshold = 0.5;
  const auto at = verdict::aggregate("x", findings(false, true, false), classifier(0.5), t);
  const auto above = verdict::aggregate("x", findings(false, true, false), classifier(0.51), t);
  CHECK_FALSE(at.has_tag(ReasonTag::kMlAmbiguity));
  CHECK(above.has_tag(ReasonTag::kMlAmbiguity));
  CHECK(above.status == ClarityStatus::kPartiallyClear);
  CHECK(above.severity == 2);
}

TEST_CASE("status never disagrees with reason count", "[verdict]") {
  for (int mask = 0; mask < 16; ++mask) {
    const auto v = verdict::aggregate(
        "x", findings((mask & 1) != 0, (mask & 2) == 0, (mask & 4) != 0),
        classifier((mask & 8) != 0 ? 0.9 : 0.1), verdict::Thresholds{});
    CHECK(v.status == verdict::status_for_reason_count(v.reasons.size()));
    CHECK(v.severity == verdict::severity_for_reason_count(v.reasons.size()));
  }
}

TEST_CASE("single-reason verdicts", "[verdict]") {
  const auto v = verdict::make_single_reason_verdict("  ", ReasonTag::kEmptyInput, "empty");
  REQUIRE(v.reasons.size() == 1);
  CHECK(v.status == ClarityStatus::kPartiallyClear);
  CHECK(v.severity == 2);
  CHECK(v.tags() == std::vector<std::string>{"EMPTY_INPUT"});
  CHECK(std::string(verdict::to_string(ClarityStatus::kPartiallyClear)) == "Partially Clear");
}
