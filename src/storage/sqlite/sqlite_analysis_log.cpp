#include "rqcd/storage/sqlite/sqlite_analysis_log.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>
#include <cstdint>
#include <limits>
#include <utility>

namespace rqcd::storage::sqlite {

namespace {

constexpr std::string_view kInsertRecord = R"(
INSERT INTO analysis_records
  (record_id, created_at, requirement, status, severity, tags_json, reasons_json, probability)
VALUES (?, ?, ?, ?, ?, ?, ?, ?)
)";

constexpr std::string_view kSelectRecent = R"(
SELECT record_id, created_at, requirement, status, severity, tags_json, reasons_json, probability
  FROM analysis_records
 ORDER BY seq DESC
 LIMIT ?
)";

std::vector<std::string> string_list(const std::string& json_text) {
  return nlohmann::json::parse(json_text).get<std::vector<std::string>>();
}

}  // namespace

SqliteAnalysisLog::SqliteAnalysisLog(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

core::Result<bool, std::string> SqliteAnalysisLog::append(const AnalysisRecord& record) {
  const std::string tags = nlohmann::json(record.tags).dump();
  const std::string reasons = nlohmann::json(record.reasons).dump();

  std::lock_guard<std::mutex> lock(mutex_);
  Statement insert(*db_, kInsertRecord);
  if (!insert.ok()) {
    return core::Result<bool, std::string>::err("cannot prepare history insert: " +
                                                insert.error());
  }

  insert.bind(1, record.record_id)
      .bind(2, record.created_at)
      .bind(3, record.requirement)
      .bind(4, record.status)
      .bind(5, static_cast<std::int64_t>(record.severity))
      .bind(6, tags)
      .bind(7, reasons)
      .bind(8, record.probability);

  if (insert.step() != Statement::Step::kDone) {
    return core::Result<bool, std::string>::err("cannot store analysis record '" +
                                                record.record_id + "': " + insert.error());
  }
  return core::Result<bool, std::string>::ok(true);
}

std::vector<AnalysisRecord> SqliteAnalysisLog::recent(const std::size_t limit) const {
  const auto max_rows = static_cast<std::size_t>(std::numeric_limits<std::int64_t>::max());

  std::lock_guard<std::mutex> lock(mutex_);
  Statement query(*db_, kSelectRecent);
  if (!query.ok()) {
    return {};
  }
  query.bind(1, static_cast<std::int64_t>(std::min(limit, max_rows)));

  std::vector<AnalysisRecord> records;
  while (query.step() == Statement::Step::kRow) {
    AnalysisRecord record;
    record.record_id = query.column_text(0);
    record.created_at = query.column_text(1);
    record.requirement = query.column_text(2);
    record.status = query.column_text(3);
    record.severity = static_cast<int>(query.column_int(4));
    try {
      record.tags = string_list(query.column_text(5));
      record.reasons = string_list(query.column_text(6));
    } catch (const nlohmann::json::exception& e) {
      std::cerr << "Warning: skipping unreadable history record '" << record.record_id
                << "': " << e.what() << "\n";
      continue;
    }
    record.probability = query.column_double(7);
    records.push_back(std::move(record));
  }
  return records;
}

std::size_t SqliteAnalysisLog::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement query(*db_, "SELECT COUNT(*) FROM analysis_records");
  if (!query.ok() || query.step() != Statement::Step::kRow) {
    return 0;
  }
  return static_cast<std::size_t>(query.column_int(0));
}

}  // namespace rqcd::storage::sqlite
