#pragma once

#include "rqcd/app/analyzer_config.h"
#include "rqcd/verdict/thresholds.h"

#include <optional>
#include <string>
#include <vector>

namespace rqcd::cli {

enum class OutputFormat {
  kText,
  kJson,
  kCsv,
};

// CliConfig collects the flags shared by the analyze, batch and history subcommands.
// Flag thresholds override the config file, which overrides built-in defaults.
struct CliConfig {
  std::optional<std::string> config_path;    // NOLINT(readability-identifier-naming)
  std::optional<std::string> training_path;  // NOLINT(readability-identifier-naming)
  verdict::ThresholdOverrides thresholds;    // NOLINT(readability-identifier-naming)
  std::optional<app::TokenizerFallbackPolicy>
      tokenizer_policy;                  // NOLINT(readability-identifier-naming)
  OutputFormat format{OutputFormat::kText};  // NOLINT(readability-identifier-naming)
  std::optional<std::string> db_path;        // NOLINT(readability-identifier-naming)
  std::size_t history_limit{5};              // NOLINT(readability-identifier-naming)

  // Problems found while parsing flag values, in command-line order.
  std::vector<std::string> usage_errors;  // NOLINT(readability-identifier-naming)
};

}  // namespace rqcd::cli
