#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lexrisk::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
// handler returns false when the value is invalid; it should print its own diagnostic.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParsedArgs {
  Config config;                         // NOLINT(readability-identifier-naming)
  std::vector<std::string> positionals;  // non-flag tokens, in order
  bool ok{true};                         // false if any flag was unknown, incomplete or invalid
};

// parse_options walks argv[start..argc-1], dispatches each recognised flag to its handler and
// collects everything else that does not start with '-' as a positional argument.
// Problems are reported to stderr and clear ParsedArgs::ok; parsing always runs to the end so
// that every problem is reported at once.
template <typename Config>
ParsedArgs<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                 const std::vector<Option<Config>>& options, int start = 2,
                                 Config default_config = {}) {
  ParsedArgs<Config> parsed;
  parsed.config = std::move(default_config);

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it != option_map.end()) {
      const Option<Config>* opt = it->second;
      if (!opt->requires_value) {
        parsed.ok = opt->handler(parsed.config, "") && parsed.ok;
      } else if (i + 1 < argc) {
        const std::string value =
            argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        parsed.ok = opt->handler(parsed.config, value) && parsed.ok;
      } else {
        std::cerr << "Option " << arg << " requires a value\n";
        parsed.ok = false;
      }
    } else if (arg.size() > 1 && arg[0] == '-' && arg != "-") {
      std::cerr << "Unknown option: " << arg << "\n";
      parsed.ok = false;
    } else {
      parsed.positionals.push_back(std::move(arg));
    }
  }

  return parsed;
}

// print_options writes one line per option, for usage messages.
template <typename Config>
void print_options(std::ostream& out, const std::vector<Option<Config>>& options) {
  for (const auto& opt : options) {
    out << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "\n      "
        << opt.description << "\n";
  }
}

}  // namespace lexrisk::apps
