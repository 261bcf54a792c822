#pragma once

#include "rqcd/app/analyzer_config.h"

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <string_view>

namespace rqcd::app {

// analyzer_config_from_json builds a config from a JSON object; every key is optional.
//
//   {"max_tokens": 20, "ml_threshold": 0.6, "top_k": 5,
//    "tokenizer_fallback": "fail_closed" | "whitespace",
//    "vague_terms": [...], "extra_vague_terms": [...],
//    "units": [...], "extra_units": [...],
//    "training_corpus": [{"text": "...", "label": 0 | 1}],
//    "trainer": {"learning_rate": 0.1, "max_iterations": 10000,
//                "tolerance": 1e-8, "l2_c": 1.0}}
//
// Throws std::runtime_error on a non-object root, a wrong value type, a negative count
// or an unknown tokenizer_fallback. Range checks happen in Analyzer::initialize.
[[nodiscard]] AnalyzerConfig analyzer_config_from_json(const nlohmann::json& j);

// Throws std::runtime_error if the file cannot be read or parsed.
[[nodiscard]] AnalyzerConfig load_analyzer_config_file(const std::string& path);

// "fail_closed" / "whitespace"; throws std::runtime_error on anything else.
[[nodiscard]] TokenizerFallbackPolicy parse_tokenizer_fallback(std::string_view value);

}  // namespace rqcd::app
