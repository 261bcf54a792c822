#pragma once

#include "rqcd/core/result.h"
#include "rqcd/storage/analysis_record.h"

#include <cstddef>
#include <string>
#include <vector>

namespace rqcd::storage {

// IAnalysisLog is an append-only history of analysis records.
class IAnalysisLog {
 public:
  virtual ~IAnalysisLog() = default;

  [[nodiscard]] virtual core::Result<bool, std::string> append(const AnalysisRecord& record) = 0;

  // Up to `limit` records, newest first (by append order).
  [[nodiscard]] virtual std::vector<AnalysisRecord> recent(std::size_t limit) const = 0;

  [[nodiscard]] virtual std::size_t size() const = 0;

 protected:
  IAnalysisLog() = default;
  IAnalysisLog(const IAnalysisLog&) = default;
  IAnalysisLog& operator=(const IAnalysisLog&) = default;
  IAnalysisLog(IAnalysisLog&&) = default;
  IAnalysisLog& operator=(IAnalysisLog&&) = default;
};

class InMemoryAnalysisLog final : public IAnalysisLog {
 public:
  [[nodiscard]] core::Result<bool, std::string> append(const AnalysisRecord& record) override;
  [[nodiscard]] std::vector<AnalysisRecord> recent(std::size_t limit) const override;
  [[nodiscard]] std::size_t size() const override { return records_.size(); }

 private:
  std::vector<AnalysisRecord> records_;
};

}  // namespace rqcd::storage
