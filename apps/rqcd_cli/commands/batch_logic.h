#pragma once

#include "cli_config.h"

#include "rqcd/app/analyzer.h"
#include "rqcd/core/clock.h"
#include "rqcd/core/id_generator.h"
#include "rqcd/storage/analysis_log.h"

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace rqcd::cli {

// One requirement per line. A trailing '\r' is dropped and blank lines are skipped.
[[nodiscard]] std::vector<std::string> read_requirements(std::istream& in);

// execute_batch analyzes every line and prints rows plus the summary counts.
// csv: header and rows on `out`, summary on stderr. json: one document. text: a report
// per statement followed by the summary.
int execute_batch(const std::vector<std::string>& lines, const app::Analyzer& analyzer,
                  OutputFormat format, storage::IAnalysisLog* history,
                  core::IIdGenerator& id_gen, core::IClock& clock, std::ostream& out);

[[nodiscard]] std::string format_summary(const app::BatchSummary& summary);

}  // namespace rqcd::cli
