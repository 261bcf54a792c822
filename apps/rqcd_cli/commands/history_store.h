#pragma once

#include "rqcd/core/result.h"
#include "rqcd/storage/sqlite/sqlite_analysis_log.h"

#include <memory>
#include <string>

namespace rqcd::cli {

// Opens (or creates) the history database at path and applies the schema.
[[nodiscard]] core::Result<std::shared_ptr<storage::sqlite::SqliteAnalysisLog>, std::string>
open_history(const std::string& path);

}  // namespace rqcd::cli
