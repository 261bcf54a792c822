#pragma once

#include "cli_config.h"

#include <string>

namespace rqcd::cli {

enum class Subcommand {
  kAnalyze,
  kBatch,
  kHistory,
};

// validate_cli_config checks the parsed flags of one subcommand.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Checks, first failure wins:
// - flag values parsed (usage_errors is empty)
// - explicit thresholds are in range (max_tokens >= 1, ml_threshold in [0, 1], top_k >= 1)
// - csv output is only offered by batch
// - history requires --db
[[nodiscard]] std::string validate_cli_config(const CliConfig& config, Subcommand subcommand);

}  // namespace rqcd::cli
