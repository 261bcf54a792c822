#include "batch.h"

#include "batch_logic.h"
#include "cli_options.h"
#include "history_store.h"
#include "startup_guard.h"

#include "rqcd/core/clock.h"
#include "rqcd/core/id_generator.h"

#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

int cmd_batch(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  using rqcd::cli::CliConfig;

  const auto options = rqcd::cli::analysis_options();
  std::vector<std::string> positionals;
  const auto config = rqcd::apps::parse_options(argc, argv, options, 2, CliConfig{}, &positionals);

  if (positionals.size() != 1) {
    std::cerr << "Usage: rqcd_cli batch <file|-> [options]\n";
    rqcd::apps::print_options(std::cerr, options);
    return 1;
  }

  if (auto problem = rqcd::cli::validate_cli_config(config, rqcd::cli::Subcommand::kBatch);
      !problem.empty()) {
    std::cerr << problem << "\n";
    return 1;
  }

  std::vector<std::string> lines;
  const std::string& input = positionals.front();
  if (input == "-") {
    lines = rqcd::cli::read_requirements(std::cin);
  } else {
    std::ifstream in(input);
    if (!in) {
      std::cerr << "Error: cannot open input file: " << input << "\n";
      return 1;
    }
    lines = rqcd::cli::read_requirements(in);
  }

  auto analyzer = rqcd::cli::build_analyzer(config);
  if (!analyzer.has_value()) {
    std::cerr << analyzer.error() << "\n";
    return 1;
  }

  std::shared_ptr<rqcd::storage::sqlite::SqliteAnalysisLog> history;
  if (config.db_path.has_value()) {
    auto opened = rqcd::cli::open_history(*config.db_path);
    if (!opened.has_value()) {
      std::cerr << opened.error() << "\n";
      return 1;
    }
    history = opened.value();
  }

  rqcd::core::SystemIdGenerator id_gen;
  rqcd::core::SystemClock clock;
  return rqcd::cli::execute_batch(lines, *analyzer.value(), config.format, history.get(), id_gen,
                                  clock, std::cout);
}
