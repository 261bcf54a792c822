#include "rqcd/app/analyzer.h"
#include "rqcd/core/clock.h"
#include "rqcd/core/id_generator.h"
#include "rqcd/storage/analysis_log.h"
#include "rqcd/storage/analysis_record.h"

#include <catch2/catch_test_macros.hpp>

using namespace rqcd;

TEST_CASE("make_analysis_record summarizes a verdict", "[storage]") {
  auto analyzer = app::Analyzer::initialize(app::AnalyzerConfig{});
  REQUIRE(analyzer.has_value());
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-01-01T00:00:00Z");

  const auto v = analyzer.value()->analyze("The UI should be user-friendly.");
  const auto record = storage::make_analysis_record(v, id_gen, clock);

  CHECK(record.record_id == "analysis-000001");
  CHECK(record.created_at == "2026-01-01T00:00:00Z");
  CHECK(record.requirement == "The UI should be user-friendly.");
  CHECK(record.status == "Unclear");
  CHECK(record.severity == 3);
  CHECK(record.tags == v.tags());
  CHECK(record.reasons.size() == v.reasons.size());
  CHECK(record.probability == v.classifier.probability);
}

TEST_CASE("record ids are ordered and unique", "[storage][ids]") {
  core::DeterministicIdGenerator deterministic;
  CHECK(deterministic.next("analysis") == "analysis-000001");
  CHECK(deterministic.next("analysis") == "analysis-000002");
  CHECK(core::format_sequence_id("run", 1234567) == "run-1234567");

  core::SystemIdGenerator system;
  const auto first = system.next("analysis");
  const auto second = system.next("analysis");
  CHECK(first.rfind("analysis-", 0) == 0);
  CHECK(first != second);
  CHECK(first < second);
}

TEST_CASE("clocks produce ISO-8601 UTC stamps", "[storage][clock]") {
  core::FixedClock fixed("2026-01-01T00:00:00Z");
  fixed.set("2026-03-04T05:06:07Z");
  CHECK(fixed.now_iso8601() == "2026-03-04T05:06:07Z");

  core::SystemClock system;
  const auto stamp = system.now_iso8601();
  REQUIRE(stamp.size() == 20);
  CHECK(stamp[10] == 'T');
  CHECK(stamp.back() == 'Z');
}

TEST_CASE("InMemoryAnalysisLog returns newest first", "[storage]") {
  storage::InMemoryAnalysisLog log;
  CHECK(log.size() == 0);
  CHECK(log.recent(5).empty());

  for (int i = 0; i < 7; ++i) {
    storage::AnalysisRecord r;
    r.record_id = "analysis-" + std::to_string(i);
    REQUIRE(log.append(r).has_value());
  }

  CHECK(log.size() == 7);
  const auto recent = log.recent(5);
  REQUIRE(recent.size() == 5);
  CHECK(recent.front().record_id == "analysis-6");
  CHECK(recent.back().record_id == "analysis-2");
  CHECK(log.recent(100).size() == 7);
  CHECK(log.recent(0).empty());
}

TEST_CASE("InMemoryAnalysisLog rejects duplicate ids", "[storage]") {
  storage::InMemoryAnalysisLog log;
  storage::AnalysisRecord r;
  r.record_id = "analysis-1";
  REQUIRE(log.append(r).has_value());
  const auto again = log.append(r);
  REQUIRE_FALSE(again.has_value());
  CHECK(log.size() == 1);
}
