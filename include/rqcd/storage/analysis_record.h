#pragma once

#include "rqcd/core/clock.h"
#include "rqcd/core/id_generator.h"
#include "rqcd/verdict/verdict.h"

#include <string>
#include <vector>

namespace rqcd::storage {

// AnalysisRecord is the persisted summary of one analyzed statement.
// Only verdict output is stored; the classifier itself is never persisted.
struct AnalysisRecord {
  std::string record_id;             // NOLINT(readability-identifier-naming)
  std::string created_at;            // NOLINT(readability-identifier-naming)
  std::string requirement;           // NOLINT(readability-identifier-naming)
  std::string status;                // NOLINT(readability-identifier-naming)
  int severity{1};                   // NOLINT(readability-identifier-naming)
  std::vector<std::string> tags;     // NOLINT(readability-identifier-naming)
  std::vector<std::string> reasons;  // NOLINT(readability-identifier-naming)
  double probability{0.0};           // NOLINT(readability-identifier-naming)

  bool operator==(const AnalysisRecord&) const = default;
};

// Record ids are drawn with prefix "analysis".
[[nodiscard]] AnalysisRecord make_analysis_record(const verdict::Verdict& v,
                                                  core::IIdGenerator& id_gen, core::IClock& clock);

}  // namespace rqcd::storage
