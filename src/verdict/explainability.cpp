#include "rqcd/verdict/explainability.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

namespace rqcd::verdict {

Explanation build_explanation(const scoring::ClassifierResult& classifier,
                              const std::vector<lexicon::VagueTermMatch>& matches) {
  Explanation explanation;
  explanation.word_weights = classifier.top_words;
  explanation.labels.reserve(classifier.top_words.size());
  for (const auto& word : classifier.top_words) {
    explanation.labels.emplace_back(word.weight > 0.0 ? "unclear" : "clear");
  }

  std::vector<core::TextSpan> spans;
  for (const auto& match : matches) {
    spans.insert(spans.end(), match.spans.begin(), match.spans.end());
  }
  explanation.highlight_spans = merge_spans(std::move(spans));
  return explanation;
}

std::string format_top_words(const std::vector<scoring::WordWeight>& words) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2);
  for (std::size_t i = 0; i < words.size(); ++i) {
    if (i > 0) {
      oss << ", ";
    }
    // Avoid printing "-0.00" for tiny negative weights
    const double shown = (words[i].weight > -0.005 && words[i].weight < 0.0) ? 0.0 : words[i].weight;
    oss << words[i].word << " (" << shown << ")";
  }
  return oss.str();
}

std::vector<core::TextSpan> merge_spans(std::vector<core::TextSpan> spans) {
  std::sort(spans.begin(), spans.end(), [](const core::TextSpan& a, const core::TextSpan& b) {
    return a.begin != b.begin ? a.begin < b.begin : a.end < b.end;
  });

  std::vector<core::TextSpan> merged;
  for (const auto& span : spans) {
    if (!merged.empty() && span.begin <= merged.back().end) {
      merged.back().end = std::max(merged.back().end, span.end);
    } else {
      merged.push_back(span);
    }
  }
  return merged;
}

std::string highlight(const std::string_view text, const std::vector<core::TextSpan>& spans,
                      const std::string_view open, const std::string_view close) {
  std::string out;
  out.reserve(text.size() + spans.size() * (open.size() + close.size()));

  std::size_t cursor = 0;
  for (const auto& span : spans) {
    if (span.begin < cursor || span.end > text.size() || span.begin >= span.end) {
      continue;
    }
    out.append(text.substr(cursor, span.begin - cursor));
    out.append(open);
    out.append(text.substr(span.begin, span.length()));
    out.append(close);
    cursor = span.end;
  }
  out.append(text.substr(cursor));
  return out;
}

}  // namespace rqcd::verdict
