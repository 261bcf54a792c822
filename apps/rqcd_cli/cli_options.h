#pragma once

#include "cli_config.h"
#include "shared/arg_parser.h"

#include "rqcd/app/analyzer.h"
#include "rqcd/core/result.h"

#include <memory>
#include <string>
#include <vector>

namespace rqcd::cli {

// Flags understood by analyze and batch.
[[nodiscard]] std::vector<apps::Option<CliConfig>> analysis_options();

// Flags understood by history.
[[nodiscard]] std::vector<apps::Option<CliConfig>> history_options();

// build_analyzer loads --config and --training, applies flag thresholds on top and
// initializes the analyzer. Errors are ready to print.
[[nodiscard]] core::Result<std::shared_ptr<const app::Analyzer>, std::string> build_analyzer(
    const CliConfig& config);

}  // namespace rqcd::cli
