#include "history.h"

#include "cli_options.h"
#include "history_logic.h"
#include "history_store.h"
#include "startup_guard.h"

#include <iostream>

int cmd_history(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = rqcd::cli::history_options();
  const auto config = rqcd::apps::parse_options(argc, argv, options, 2);

  if (auto problem = rqcd::cli::validate_cli_config(config, rqcd::cli::Subcommand::kHistory);
      !problem.empty()) {
    std::cerr << problem << "\n";
    return 1;
  }

  auto opened = rqcd::cli::open_history(*config.db_path);
  if (!opened.has_value()) {
    std::cerr << opened.error() << "\n";
    return 1;
  }

  return rqcd::cli::execute_history(*opened.value(), config.history_limit, config.format,
                                    std::cout);
}
