#include "analyze_logic.h"

#include "rqcd/exporting/verdict_json.h"
#include "rqcd/verdict/explainability.h"

#include <nlohmann/json.hpp>

#include <iomanip>
#include <iostream>

namespace rqcd::cli {

void print_verdict_text(const verdict::Verdict& v, std::ostream& out) {
  out << "Requirement: " << v.text << "\n";
  out << "Status: " << verdict::to_string(v.status) << " (severity " << v.severity << ")\n";

  if (v.reasons.empty()) {
    out << "Reasons: none, sentence appears well-defined.\n";
  } else {
    out << "Reasons:\n";
    for (const auto& reason : v.reasons) {
      out << "  - [" << verdict::to_label(reason.tag) << "] " << reason.message << "\n";
    }
  }

  if (!v.classifier.top_words.empty()) {
    out << "Top words: " << verdict::format_top_words(v.classifier.top_words) << "\n";
  }
  if (!v.explanation.highlight_spans.empty()) {
    out << "Highlighted: " << verdict::highlight(v.text, v.explanation.highlight_spans) << "\n";
  }
  for (const auto& warning : v.warnings) {
    out << "Warning: " << warning << "\n";
  }
}

void record_verdicts(const std::vector<verdict::Verdict>& verdicts, storage::IAnalysisLog& log,
                     core::IIdGenerator& id_gen, core::IClock& clock) {
  for (const auto& v : verdicts) {
    auto appended = log.append(storage::make_analysis_record(v, id_gen, clock));
    if (!appended.has_value()) {
      std::cerr << "Warning: history not recorded: " << appended.error() << "\n";
    }
  }
}

int execute_analyze(const std::string& text, const app::Analyzer& analyzer,
                    const OutputFormat format, storage::IAnalysisLog* history,
                    core::IIdGenerator& id_gen, core::IClock& clock, std::ostream& out) {
  const verdict::Verdict result = analyzer.analyze(text);

  if (format == OutputFormat::kJson) {
    out << exporting::to_json(result).dump(2) << "\n";
  } else {
    print_verdict_text(result, out);
  }

  if (history != nullptr) {
    record_verdicts({result}, *history, id_gen, clock);
  }
  return 0;
}

}  // namespace rqcd::cli
