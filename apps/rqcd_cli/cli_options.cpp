#include "cli_options.h"

#include "rqcd/app/analyzer_config_json.h"
#include "rqcd/core/normalization.h"
#include "rqcd/scoring/training_corpus.h"

#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace rqcd::cli {

namespace {

// Digits only; rejects signs so "-5" cannot wrap around.
bool parse_count(const std::string& value, std::size_t& out) {
  if (value.empty() || value.size() > 9) {
    return false;
  }
  for (const char ch : value) {
    if (!core::is_ascii_digit(ch)) {
      return false;
    }
  }
  out = static_cast<std::size_t>(std::strtoul(value.c_str(), nullptr, 10));
  return true;
}

bool parse_probability(const std::string& value, double& out) {
  if (value.empty()) {
    return false;
  }
  char* end = nullptr;
  out = std::strtod(value.c_str(), &end);
  return end != nullptr && *end == '\0';
}

bool fail(CliConfig& c, std::string message) {
  c.usage_errors.push_back(std::move(message));
  return false;
}

apps::Option<CliConfig> db_option() {
  return {"--db", true, "SQLite file for analysis history", [](CliConfig& c, const std::string& v) {
            if (v.empty()) {
              return fail(c, "--db requires a path");
            }
            c.db_path = v;
            return true;
          }};
}

}  // namespace

std::vector<apps::Option<CliConfig>> analysis_options() {
  return {
      {"--config", true, "JSON analyzer configuration file",
       [](CliConfig& c, const std::string& v) {
         if (v.empty()) {
           return fail(c, "--config requires a path");
         }
         c.config_path = v;
         return true;
       }},
      {"--training", true, "JSON training corpus replacing the built-in one",
       [](CliConfig& c, const std::string& v) {
         if (v.empty()) {
           return fail(c, "--training requires a path");
         }
         c.training_path = v;
         return true;
       }},
      {"--max-tokens", true, "Token count above which a sentence is complex",
       [](CliConfig& c, const std::string& v) {
         std::size_t n = 0;
         if (!parse_count(v, n)) {
           return fail(c, "invalid --max-tokens: '" + v + "'");
         }
         c.thresholds.max_tokens = n;
         return true;
       }},
      {"--ml-threshold", true, "Probability above which the classifier flags ambiguity",
       [](CliConfig& c, const std::string& v) {
         double x = 0.0;
         if (!parse_probability(v, x)) {
           return fail(c, "invalid --ml-threshold: '" + v + "'");
         }
         c.thresholds.ml_threshold = x;
         return true;
       }},
      {"--top-k", true, "Number of influential words to report",
       [](CliConfig& c, const std::string& v) {
         std::size_t n = 0;
         if (!parse_count(v, n)) {
           return fail(c, "invalid --top-k: '" + v + "'");
         }
         c.thresholds.top_k = n;
         return true;
       }},
      {"--format", true, "Output format (text|json|csv)",
       [](CliConfig& c, const std::string& v) {
         if (v == "text") {
           c.format = OutputFormat::kText;
         } else if (v == "json") {
           c.format = OutputFormat::kJson;
         } else if (v == "csv") {
           c.format = OutputFormat::kCsv;
         } else {
           return fail(c, "invalid --format: '" + v + "' (valid: text, json, csv)");
         }
         return true;
       }},
      {"--tokenizer-fallback", false, "Fall back to whitespace tokenization instead of failing",
       [](CliConfig& c, const std::string& /*v*/) {
         c.tokenizer_policy = app::TokenizerFallbackPolicy::kDegradeToWhitespace;
         return true;
       }},
      db_option(),
  };
}

std::vector<apps::Option<CliConfig>> history_options() {
  return {
      db_option(),
      {"--limit", true, "Number of records to list (default 5)",
       [](CliConfig& c, const std::string& v) {
         std::size_t n = 0;
         if (!parse_count(v, n)) {
           return fail(c, "invalid --limit: '" + v + "'");
         }
         c.history_limit = n;
         return true;
       }},
      {"--format", true, "Output format (text|json)",
       [](CliConfig& c, const std::string& v) {
         if (v == "text") {
           c.format = OutputFormat::kText;
         } else if (v == "json") {
           c.format = OutputFormat::kJson;
         } else {
           return fail(c, "invalid --format: '" + v + "' (valid: text, json)");
         }
         return true;
       }},
  };
}

core::Result<std::shared_ptr<const app::Analyzer>, std::string> build_analyzer(
    const CliConfig& config) {
  using BuildResult = core::Result<std::shared_ptr<const app::Analyzer>, std::string>;

  app::AnalyzerConfig analyzer_config;
  try {
    if (config.config_path.has_value()) {
      analyzer_config = app::load_analyzer_config_file(*config.config_path);
    }
    if (config.training_path.has_value()) {
      analyzer_config.training_corpus = scoring::load_training_corpus_file(*config.training_path);
    }
  } catch (const std::runtime_error& e) {
    return BuildResult::err(std::string("Error: ") + e.what());
  }

  analyzer_config.thresholds = verdict::apply_overrides(analyzer_config.thresholds, config.thresholds);
  if (config.tokenizer_policy.has_value()) {
    analyzer_config.tokenizer_policy = *config.tokenizer_policy;
  }

  auto initialized = app::Analyzer::initialize(std::move(analyzer_config));
  if (!initialized.has_value()) {
    const auto& error = initialized.error();
    return BuildResult::err("Error: analyzer initialization failed (" +
                            std::string(core::to_string(error.code)) + "): " + error.message);
  }
  return BuildResult::ok(initialized.value());
}

}  // namespace rqcd::cli
