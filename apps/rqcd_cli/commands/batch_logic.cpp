#include "batch_logic.h"

#include "analyze_logic.h"

#include "rqcd/core/normalization.h"
#include "rqcd/exporting/verdict_json.h"
#include "rqcd/exporting/verdict_row.h"

#include <nlohmann/json.hpp>

#include <iostream>

namespace rqcd::cli {

std::vector<std::string> read_requirements(std::istream& in) {
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (!core::is_blank(line)) {
      lines.push_back(line);
    }
  }
  return lines;
}

std::string format_summary(const app::BatchSummary& summary) {
  std::string line = "Summary: " + std::to_string(summary.total) + " analyzed, " +
                     std::to_string(summary.clear) + " Clear, " +
                     std::to_string(summary.partially_clear) + " Partially Clear, " +
                     std::to_string(summary.unclear) + " Unclear";
  if (summary.blank > 0) {
    line += " (" + std::to_string(summary.blank) + " blank skipped)";
  }
  return line;
}

int execute_batch(const std::vector<std::string>& lines, const app::Analyzer& analyzer,
                  const OutputFormat format, storage::IAnalysisLog* history,
                  core::IIdGenerator& id_gen, core::IClock& clock, std::ostream& out) {
  const auto verdicts = analyzer.analyze_batch(lines);
  const auto summary = app::summarize(verdicts);

  switch (format) {
    case OutputFormat::kCsv:
      out << exporting::csv_header() << "\n";
      for (const auto& v : verdicts) {
        out << exporting::to_csv_line(exporting::to_row(v)) << "\n";
      }
      std::cerr << format_summary(summary) << "\n";
      break;
    case OutputFormat::kJson:
      out << exporting::to_json(verdicts, summary).dump(2) << "\n";
      break;
    case OutputFormat::kText:
      for (const auto& v : verdicts) {
        print_verdict_text(v, out);
        out << "\n";
      }
      out << format_summary(summary) << "\n";
      break;
  }

  if (history != nullptr) {
    record_verdicts(verdicts, *history, id_gen, clock);
  }
  return 0;
}

}  // namespace rqcd::cli
