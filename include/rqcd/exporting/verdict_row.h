#pragma once

#include "rqcd/verdict/verdict.h"

#include <string>
#include <string_view>

namespace rqcd::exporting {

// VerdictRow is the flat, display-ready form of a verdict used by tables and CSV.
struct VerdictRow {
  std::string requirement;  // NOLINT(readability-identifier-naming)
  std::string status;       // NOLINT(readability-identifier-naming)
  int severity{1};          // NOLINT(readability-identifier-naming)
  std::string tags;         // NOLINT(readability-identifier-naming)
  std::string reasons;      // NOLINT(readability-identifier-naming)
  std::string top_words;    // NOLINT(readability-identifier-naming)

  bool operator==(const VerdictRow&) const = default;
};

inline constexpr const char* kNoIssuesMessage = "Sentence appears well-defined.";

// Tags sorted and joined with ", "; reason messages joined with " | ".
[[nodiscard]] VerdictRow to_row(const verdict::Verdict& v);

[[nodiscard]] std::string csv_header();

// One CSV record without the trailing newline. Fields containing a comma, quote,
// CR or LF are quoted and embedded quotes doubled.
[[nodiscard]] std::string to_csv_line(const VerdictRow& row);

[[nodiscard]] std::string csv_escape(std::string_view field);

}  // namespace rqcd::exporting
