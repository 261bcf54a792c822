#include "commands/analyze.h"
#include "commands/batch.h"
#include "commands/history.h"

#include "rqcd/core/version.h"

#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "rqcd_cli v" << rqcd::core::kBuildVersion << " - requirement clarity detector\n"
            << "Usage:\n"
            << "  rqcd_cli analyze \"<requirement>\" [options]\n"
            << "  rqcd_cli batch <file|-> [options]\n"
            << "  rqcd_cli history --db <path> [--limit N]\n"
            << "Run a subcommand without arguments to list its options.\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "analyze") {
    return cmd_analyze(argc, argv);
  }
  if (subcommand == "batch") {
    return cmd_batch(argc, argv);
  }
  if (subcommand == "history") {
    return cmd_history(argc, argv);
  }
  if (subcommand == "--version") {
    std::cout << rqcd::core::kBuildVersion << "\n";
    return 0;
  }

  std::cerr << "Unknown subcommand: " << subcommand << "\n";
  print_usage();
  return 1;
}
