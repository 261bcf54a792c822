#pragma once

#include "rqcd/core/types.h"
#include "rqcd/lexicon/lexicon.h"
#include "rqcd/scoring/statistical_scorer.h"
#include "rqcd/verdict/verdict.h"

#include <string>
#include <string_view>
#include <vector>

namespace rqcd::verdict {

// Chart data and highlight spans for one analysis. Word order follows the classifier
// result; labels are "unclear" for positive weights and "clear" otherwise.
[[nodiscard]] Explanation build_explanation(const scoring::ClassifierResult& classifier,
                                            const std::vector<lexicon::VagueTermMatch>& matches);

// "and (0.58), be (0.58)"; empty when there are no words.
[[nodiscard]] std::string format_top_words(const std::vector<scoring::WordWeight>& words);

// Sorts spans and merges overlapping or touching ones.
[[nodiscard]] std::vector<core::TextSpan> merge_spans(std::vector<core::TextSpan> spans);

// Wraps every span of text in open/close markers ("**fast**"). Spans must be sorted and
// non-overlapping; spans past the end of text are ignored.
[[nodiscard]] std::string highlight(std::string_view text, const std::vector<core::TextSpan>& spans,
                                    std::string_view open = "**", std::string_view close = "**");

}  // namespace rqcd::verdict
