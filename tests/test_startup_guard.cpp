#include <catch2/catch_test_macros.hpp>

#include "cli_config.h"
#include "startup_guard.h"

using namespace rqcd::cli;

TEST_CASE("validate_cli_config: defaults are valid for analyze and batch", "[startup][config]") {
  const CliConfig config;
  CHECK(validate_cli_config(config, Subcommand::kAnalyze).empty());
  CHECK(validate_cli_config(config, Subcommand::kBatch).empty());
}

TEST_CASE("validate_cli_config: first usage error is reported", "[startup][config]") {
  CliConfig config;
  config.usage_errors = {"invalid --top-k: 'x'", "invalid --format: 'xml'"};
  CHECK(validate_cli_config(config, Subcommand::kAnalyze) == "Error: invalid --top-k: 'x'");
}

TEST_CASE("validate_cli_config: threshold ranges", "[startup][config]") {
  CliConfig config;

  SECTION("max_tokens zero") {
    config.thresholds.max_tokens = 0;
    CHECK_FALSE(validate_cli_config(config, Subcommand::kAnalyze).empty());
  }
  SECTION("ml_threshold above one") {
    config.thresholds.ml_threshold = 1.2;
    CHECK_FALSE(validate_cli_config(config, Subcommand::kBatch).empty());
  }
  SECTION("ml_threshold at the bounds") {
    config.thresholds.ml_threshold = 1.0;
    CHECK(validate_cli_config(config, Subcommand::kBatch).empty());
    config.thresholds.ml_threshold = 0.0;
    CHECK(validate_cli_config(config, Subcommand::kBatch).empty());
  }
  SECTION("top_k zero") {
    config.thresholds.top_k = 0;
    CHECK_FALSE(validate_cli_config(config, Subcommand::kAnalyze).empty());
  }
}

TEST_CASE("validate_cli_config: csv is batch only", "[startup][config]") {
  CliConfig config;
  config.format = OutputFormat::kCsv;
  CHECK_FALSE(validate_cli_config(config, Subcommand::kAnalyze).empty());
  CHECK(validate_cli_config(config, Subcommand::kBatch).empty());
}

TEST_CASE("validate_cli_config: history requires --db", "[startup][config]") {
  CliConfig config;
  CHECK(validate_cli_config(config, Subcommand::kHistory) == "Error: history requires --db <path>");
  config.db_path = "history.db";
  CHECK(validate_cli_config(config, Subcommand::kHistory).empty());
}
