#include "rqcd/storage/analysis_log.h"

#include <algorithm>

namespace rqcd::storage {

core::Result<bool, std::string> InMemoryAnalysisLog::append(const AnalysisRecord& record) {
  const bool duplicate =
      std::any_of(records_.begin(), records_.end(),
                  [&](const AnalysisRecord& r) { return r.record_id == record.record_id; });
  if (duplicate) {
    return core::Result<bool, std::string>::err("duplicate record_id: " + record.record_id);
  }
  records_.push_back(record);
  return core::Result<bool, std::string>::ok(true);
}

std::vector<AnalysisRecord> InMemoryAnalysisLog::recent(const std::size_t limit) const {
  const std::size_t count = std::min(limit, records_.size());
  return {records_.rbegin(), records_.rbegin() + static_cast<std::ptrdiff_t>(count)};
}

}  // namespace rqcd::storage
