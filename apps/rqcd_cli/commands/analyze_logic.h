#pragma once

#include "cli_config.h"

#include "rqcd/app/analyzer.h"
#include "rqcd/core/clock.h"
#include "rqcd/core/id_generator.h"
#include "rqcd/storage/analysis_log.h"
#include "rqcd/verdict/verdict.h"

#include <ostream>
#include <string>

namespace rqcd::cli {

// Human-readable report: status line, reasons, top words, highlighted text, warnings.
void print_verdict_text(const verdict::Verdict& v, std::ostream& out);

// record_verdicts appends one history record per verdict. Failures are reported as
// warnings on stderr and never abort the command.
void record_verdicts(const std::vector<verdict::Verdict>& verdicts, storage::IAnalysisLog& log,
                     core::IIdGenerator& id_gen, core::IClock& clock);

// execute_analyze analyzes one statement and prints it in the requested format.
// history may be null. Takes only interface types for storage.
int execute_analyze(const std::string& text, const app::Analyzer& analyzer, OutputFormat format,
                    storage::IAnalysisLog* history, core::IIdGenerator& id_gen,
                    core::IClock& clock, std::ostream& out);

}  // namespace rqcd::cli
