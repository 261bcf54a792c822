#include "rqcd/app/analyzer_config_json.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace rqcd::app {

namespace {

std::size_t read_count(const nlohmann::json& j, const char* key) {
  const auto& field = j.at(key);
  if (!field.is_number_integer()) {
    throw std::runtime_error(std::string(key) + " must be a whole number");
  }
  const auto value = field.get<std::int64_t>();
  if (value < 0) {
    throw std::runtime_error(std::string(key) + " must not be negative");
  }
  return static_cast<std::size_t>(value);
}

std::vector<std::string> read_strings(const nlohmann::json& j, const char* key) {
  if (!j.at(key).is_array()) {
    throw std::runtime_error(std::string(key) + " must be an array of strings");
  }
  return j.at(key).get<std::vector<std::string>>();
}

// Base list (replaced when `replace_key` is present) followed by `extra_key` entries.
std::vector<std::string> merged_list(const nlohmann::json& j, const char* replace_key,
                                     const char* extra_key, std::vector<std::string> defaults) {
  std::vector<std::string> out =
      j.contains(replace_key) ? read_strings(j, replace_key) : std::move(defaults);
  if (j.contains(extra_key)) {
    auto extra = read_strings(j, extra_key);
    out.insert(out.end(), extra.begin(), extra.end());
  }
  return out;
}

scoring::TrainerOptions read_trainer(const nlohmann::json& t) {
  if (!t.is_object()) {
    throw std::runtime_error("trainer must be an object");
  }
  scoring::TrainerOptions options;
  options.learning_rate = t.value("learning_rate", options.learning_rate);
  if (t.contains("max_iterations")) {
    options.max_iterations = read_count(t, "max_iterations");
  }
  options.tolerance = t.value("tolerance", options.tolerance);
  options.l2_c = t.value("l2_c", options.l2_c);
  return options;
}

AnalyzerConfig parse_config(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw std::runtime_error("analyzer config must be a JSON object");
  }

  AnalyzerConfig config;

  if (j.contains("max_tokens")) {
    config.thresholds.max_tokens = read_count(j, "max_tokens");
  }
  config.thresholds.ml_threshold = j.value("ml_threshold", config.thresholds.ml_threshold);
  if (j.contains("top_k")) {
    config.thresholds.top_k = read_count(j, "top_k");
  }

  if (j.contains("tokenizer_fallback")) {
    config.tokenizer_policy =
        parse_tokenizer_fallback(j.at("tokenizer_fallback").get<std::string>());
  }

  config.lexicon = lexicon::Lexicon(
      merged_list(j, "vague_terms", "extra_vague_terms", lexicon::default_vague_terms()),
      merged_list(j, "units", "extra_units", lexicon::default_units()));

  if (j.contains("training_corpus")) {
    config.training_corpus = scoring::training_corpus_from_json(j.at("training_corpus"));
  }

  if (j.contains("trainer")) {
    config.trainer = read_trainer(j.at("trainer"));
  }

  return config;
}

}  // namespace

TokenizerFallbackPolicy parse_tokenizer_fallback(const std::string_view value) {
  if (value == to_string(TokenizerFallbackPolicy::kFailClosed)) {
    return TokenizerFallbackPolicy::kFailClosed;
  }
  if (value == to_string(TokenizerFallbackPolicy::kDegradeToWhitespace)) {
    return TokenizerFallbackPolicy::kDegradeToWhitespace;
  }
  throw std::runtime_error("unknown tokenizer_fallback '" + std::string(value) +
                           "' (expected fail_closed or whitespace)");
}

AnalyzerConfig analyzer_config_from_json(const nlohmann::json& j) {
  // Surface nlohmann type errors as the documented runtime_error.
  try {
    return parse_config(j);
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::string("invalid analyzer config: ") + e.what());
  }
}

AnalyzerConfig load_analyzer_config_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot open config file: " + path);
  }

  std::stringstream buffer;
  buffer << in.rdbuf();

  nlohmann::json j;
  try {
    j = nlohmann::json::parse(buffer.str());
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("invalid config file " + path + ": " + e.what());
  }
  return analyzer_config_from_json(j);
}

}  // namespace rqcd::app
