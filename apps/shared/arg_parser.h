#pragma once

#include <functional>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rqcd::apps {

// Option is one flag of a subcommand. The handler stores the value into Config
// and returns false when the value is unusable; handlers record their own
// problems in Config so the startup guard can report them.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

namespace detail {

template <typename Config>
const Option<Config>* find_option(const std::vector<Option<Config>>& options,
                                  const std::string_view name) {
  for (const auto& opt : options) {
    if (opt.name == name) {
      return &opt;
    }
  }
  return nullptr;
}

}  // namespace detail

// parse_options reads argv[start..argc-1].
// Flags take their value from the next token or inline ("--top-k=3").
// "--" ends flag parsing; everything after it, and a lone "-" (stdin), is
// positional. Positionals go to *positionals when given and are dropped otherwise.
// Unknown flags and missing values are reported on stderr.
template <typename Config>
Config parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                     const std::vector<Option<Config>>& options, int start = 1,
                     Config config = {}, std::vector<std::string>* positionals = nullptr) {
  const auto keep_positional = [positionals](std::string token) {
    if (positionals != nullptr) {
      positionals->push_back(std::move(token));
    }
  };

  bool flags_done = false;
  for (int i = start; i < argc; ++i) {
    std::string token = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    if (flags_done || token == "-" || token.rfind('-', 0) != 0) {
      keep_positional(std::move(token));
      continue;
    }
    if (token == "--") {
      flags_done = true;
      continue;
    }

    std::string name = token;
    std::optional<std::string> inline_value;
    if (const auto eq = token.find('='); eq != std::string::npos) {
      name = token.substr(0, eq);
      inline_value = token.substr(eq + 1);
    }

    const Option<Config>* opt = detail::find_option(options, name);
    if (opt == nullptr) {
      std::cerr << "Unknown option: " << name << "\n";
      continue;
    }

    if (!opt->requires_value) {
      opt->handler(config, inline_value.value_or(""));
    } else if (inline_value) {
      opt->handler(config, *inline_value);
    } else if (i + 1 < argc) {
      opt->handler(config, argv[++i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    } else {
      std::cerr << "Option " << name << " requires a value\n";
      opt->handler(config, "");
    }
  }

  return config;
}

// print_options writes one aligned usage line per option.
template <typename Config>
void print_options(std::ostream& out, const std::vector<Option<Config>>& options) {
  for (const auto& opt : options) {
    const std::string flag = opt.name + (opt.requires_value ? " <value>" : "");
    out << "  " << std::left << std::setw(28) << flag << opt.description << "\n";
  }
}

}  // namespace rqcd::apps
