#include "startup_guard.h"

namespace rqcd::cli {

std::string validate_cli_config(const CliConfig& config, const Subcommand subcommand) {
  if (!config.usage_errors.empty()) {
    return "Error: " + config.usage_errors.front();
  }

  const auto& t = config.thresholds;
  if (t.max_tokens.has_value() && *t.max_tokens < 1) {
    return "Error: --max-tokens must be at least 1";
  }
  if (t.ml_threshold.has_value() && (*t.ml_threshold < 0.0 || *t.ml_threshold > 1.0)) {
    return "Error: --ml-threshold must be within [0, 1]";
  }
  if (t.top_k.has_value() && *t.top_k < 1) {
    return "Error: --top-k must be at least 1";
  }

  switch (subcommand) {
    case Subcommand::kAnalyze:
      if (config.format == OutputFormat::kCsv) {
        return "Error: --format csv is only available for batch";
      }
      break;
    case Subcommand::kBatch:
      break;
    case Subcommand::kHistory:
      if (!config.db_path.has_value()) {
        return "Error: history requires --db <path>";
      }
      break;
  }

  return "";
}

}  // namespace rqcd::cli
