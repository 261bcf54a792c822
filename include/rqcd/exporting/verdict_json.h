#pragma once

#include "rqcd/app/analyzer.h"
#include "rqcd/verdict/verdict.h"

#include <nlohmann/json_fwd.hpp>

#include <vector>

namespace rqcd::exporting {

// Machine-readable verdict. Keys sort alphabetically (nlohmann's default std::map object):
//   classifier{probability, top_words[{weight, word}]}, constraint{evidence, present},
//   complexity{is_complex, token_count}, explanation{highlight_spans, labels, word_weights},
//   reasons[{message, tag}], requirement, severity, status, tags, vague_terms[{spans, term}],
//   warnings
[[nodiscard]] nlohmann::json to_json(const verdict::Verdict& v);

// {"verdicts": [...], "summary": {clear, partially_clear, unclear, total}}
[[nodiscard]] nlohmann::json to_json(const std::vector<verdict::Verdict>& verdicts,
                                     const app::BatchSummary& summary);

}  // namespace rqcd::exporting
