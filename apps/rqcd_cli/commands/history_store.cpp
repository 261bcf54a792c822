#include "history_store.h"

#include "rqcd/storage/sqlite/sqlite_db.h"

namespace rqcd::cli {

core::Result<std::shared_ptr<storage::sqlite::SqliteAnalysisLog>, std::string> open_history(
    const std::string& path) {
  using OpenResult =
      core::Result<std::shared_ptr<storage::sqlite::SqliteAnalysisLog>, std::string>;

  auto db_result = storage::sqlite::SqliteDb::open(path);
  if (!db_result.has_value()) {
    return OpenResult::err("Error: " + db_result.error());
  }

  auto db = db_result.value();
  auto schema_result = db->migrate();
  if (!schema_result.has_value()) {
    return OpenResult::err("Error: cannot prepare history database: " + schema_result.error());
  }

  return OpenResult::ok(std::make_shared<storage::sqlite::SqliteAnalysisLog>(db));
}

}  // namespace rqcd::cli
