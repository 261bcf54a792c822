#include "rqcd/exporting/verdict_json.h"

#include <nlohmann/json.hpp>

namespace rqcd::exporting {

namespace {

nlohmann::json span_json(const core::TextSpan& span) {
  return nlohmann::json::array({span.begin, span.end});
}

nlohmann::json word_weights_json(const std::vector<scoring::WordWeight>& words) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& w : words) {
    out.push_back({{"word", w.word}, {"weight", w.weight}});
  }
  return out;
}

}  // namespace

nlohmann::json to_json(const verdict::Verdict& v) {
  using json = nlohmann::json;

  json j;
  j["requirement"] = v.text;
  j["status"] = verdict::to_string(v.status);
  j["severity"] = v.severity;
  j["tags"] = v.tags();

  json reasons = json::array();
  for (const auto& reason : v.reasons) {
    reasons.push_back({{"tag", verdict::to_label(reason.tag)}, {"message", reason.message}});
  }
  j["reasons"] = std::move(reasons);

  json vague = json::array();
  for (const auto& match : v.vague_matches) {
    json spans = json::array();
    for (const auto& span : match.spans) {
      spans.push_back(span_json(span));
    }
    vague.push_back({{"term", match.term}, {"spans", std::move(spans)}});
  }
  j["vague_terms"] = std::move(vague);

  j["constraint"] = {{"present", v.has_constraint},
                     {"evidence", v.constraint_evidence.has_value()
                                      ? json(*v.constraint_evidence)
                                      : json(nullptr)}};
  j["complexity"] = {{"is_complex", v.is_complex}, {"token_count", v.token_count}};

  j["classifier"] = {{"probability", v.classifier.probability},
                     {"top_words", word_weights_json(v.classifier.top_words)}};

  json highlight = json::array();
  for (const auto& span : v.explanation.highlight_spans) {
    highlight.push_back(span_json(span));
  }
  j["explanation"] = {{"word_weights", word_weights_json(v.explanation.word_weights)},
                      {"labels", v.explanation.labels},
                      {"highlight_spans", std::move(highlight)}};

  j["warnings"] = v.warnings;
  return j;
}

nlohmann::json to_json(const std::vector<verdict::Verdict>& verdicts,
                       const app::BatchSummary& summary) {
  nlohmann::json items = nlohmann::json::array();
  for (const auto& v : verdicts) {
    items.push_back(to_json(v));
  }

  nlohmann::json j;
  j["verdicts"] = std::move(items);
  j["summary"] = {{"clear", summary.clear},
                  {"partially_clear", summary.partially_clear},
                  {"unclear", summary.unclear},
                  {"total", summary.total},
                  {"blank", summary.blank}};
  return j;
}

}  // namespace rqcd::exporting
