#include "history_logic.h"

#include "rqcd/core/normalization.h"

#include <nlohmann/json.hpp>

#include <iomanip>
#include <sstream>

namespace rqcd::cli {

int execute_history(const storage::IAnalysisLog& log, const std::size_t limit,
                    const OutputFormat format, std::ostream& out) {
  const auto records = log.recent(limit);

  if (format == OutputFormat::kJson) {
    nlohmann::json j;
    j["total"] = log.size();
    j["records"] = nlohmann::json::array();
    for (const auto& r : records) {
      j["records"].push_back({{"record_id", r.record_id},
                              {"created_at", r.created_at},
                              {"requirement", r.requirement},
                              {"status", r.status},
                              {"severity", r.severity},
                              {"tags", r.tags},
                              {"reasons", r.reasons},
                              {"probability", r.probability}});
    }
    out << j.dump(2) << "\n";
    return 0;
  }

  if (records.empty()) {
    out << "No analyses recorded yet.\n";
    return 0;
  }

  for (const auto& r : records) {
    out << r.created_at << " [" << r.status << "] " << r.requirement << "\n";
    if (!r.tags.empty()) {
      out << "    tags: " << core::join(r.tags, ", ") << "\n";
    }
    std::ostringstream probability;
    probability << std::fixed << std::setprecision(2) << r.probability;
    out << "    p(unclear)=" << probability.str() << "\n";
  }
  return 0;
}

}  // namespace rqcd::cli
