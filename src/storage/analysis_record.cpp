#include "rqcd/storage/analysis_record.h"

namespace rqcd::storage {

AnalysisRecord make_analysis_record(const verdict::Verdict& v, core::IIdGenerator& id_gen,
                                    core::IClock& clock) {
  AnalysisRecord record;
  record.record_id = id_gen.next("analysis");
  record.created_at = clock.now_iso8601();
  record.requirement = v.text;
  record.status = verdict::to_string(v.status);
  record.severity = v.severity;
  record.tags = v.tags();
  record.reasons.reserve(v.reasons.size());
  for (const auto& reason : v.reasons) {
    record.reasons.push_back(reason.message);
  }
  record.probability = v.classifier.probability;
  return record;
}

}  // namespace rqcd::storage
