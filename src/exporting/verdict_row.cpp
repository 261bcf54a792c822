#include "rqcd/exporting/verdict_row.h"

#include "rqcd/core/normalization.h"
#include "rqcd/verdict/explainability.h"

#include <vector>

namespace rqcd::exporting {

VerdictRow to_row(const verdict::Verdict& v) {
  VerdictRow row;
  row.requirement = v.text;
  row.status = verdict::to_string(v.status);
  row.severity = v.severity;
  row.tags = core::join(v.tags(), ", ");

  if (v.reasons.empty()) {
    row.reasons = kNoIssuesMessage;
  } else {
    std::vector<std::string> messages;
    messages.reserve(v.reasons.size());
    for (const auto& reason : v.reasons) {
      messages.push_back(reason.message);
    }
    row.reasons = core::join(messages, " | ");
  }

  row.top_words = verdict::format_top_words(v.classifier.top_words);
  return row;
}

std::string csv_header() {
  return "Requirement,Status,Severity,Tags,Reasons,Top Words";
}

std::string csv_escape(const std::string_view field) {
  if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
    return std::string(field);
  }

  std::string out;
  out.reserve(field.size() + 2);
  out.push_back('"');
  for (const char ch : field) {
    if (ch == '"') {
      out.push_back('"');
    }
    out.push_back(ch);
  }
  out.push_back('"');
  return out;
}

std::string to_csv_line(const VerdictRow& row) {
  std::string line;
  line += csv_escape(row.requirement);
  line += ',';
  line += csv_escape(row.status);
  line += ',';
  line += std::to_string(row.severity);
  line += ',';
  line += csv_escape(row.tags);
  line += ',';
  line += csv_escape(row.reasons);
  line += ',';
  line += csv_escape(row.top_words);
  return line;
}

}  // namespace rqcd::exporting
