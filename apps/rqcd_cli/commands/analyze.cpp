#include "analyze.h"

#include "analyze_logic.h"
#include "cli_options.h"
#include "history_store.h"
#include "startup_guard.h"

#include "rqcd/core/clock.h"
#include "rqcd/core/id_generator.h"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

int cmd_analyze(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  using rqcd::cli::CliConfig;

  const auto options = rqcd::cli::analysis_options();
  std::vector<std::string> positionals;
  const auto config = rqcd::apps::parse_options(argc, argv, options, 2, CliConfig{}, &positionals);

  if (positionals.size() != 1) {
    std::cerr << "Usage: rqcd_cli analyze \"<requirement>\" [options]\n";
    rqcd::apps::print_options(std::cerr, options);
    return 1;
  }

  if (auto problem = rqcd::cli::validate_cli_config(config, rqcd::cli::Subcommand::kAnalyze);
      !problem.empty()) {
    std::cerr << problem << "\n";
    return 1;
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
  return rqcd::cli::execute_analyze(positionals.front(), *analyzer.value(), config.format,
                                    history.get(), id_gen, clock, std::cout);
}
