#pragma once

#include "rqcd/storage/analysis_log.h"
#include "rqcd/storage/sqlite/sqlite_db.h"

#include <memory>
#include <mutex>

namespace rqcd::storage::sqlite {

// SqliteAnalysisLog implements IAnalysisLog on the analysis_records table.
// The caller applies the schema (SqliteDb::migrate) before use.
// A mutex serializes access to the shared connection.
class SqliteAnalysisLog final : public IAnalysisLog {
 public:
  explicit SqliteAnalysisLog(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] core::Result<bool, std::string> append(const AnalysisRecord& record) override;
  [[nodiscard]] std::vector<AnalysisRecord> recent(std::size_t limit) const override;
  [[nodiscard]] std::size_t size() const override;

 private:
  std::shared_ptr<SqliteDb> db_;
  mutable std::mutex mutex_;
};

}  // namespace rqcd::storage::sqlite
