#pragma once

#include "cli_config.h"

#include "rqcd/storage/analysis_log.h"

#include <cstddef>
#include <ostream>

namespace rqcd::cli {

// execute_history prints the newest `limit` records, newest first.
// Takes only interface types; no concrete storage headers in this TU.
int execute_history(const storage::IAnalysisLog& log, std::size_t limit, OutputFormat format,
                    std::ostream& out);

}  // namespace rqcd::cli
