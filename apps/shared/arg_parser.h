#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cqa::apps {

// Option describes a single command-line flag accepted by an app.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false on validation failure. The handler reports its
// own diagnostic; the parser only counts the failure.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParsedOptions {
  Config config;                    // NOLINT(readability-identifier-naming)
  std::vector<std::string> errors;  // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool ok() const { return errors.empty(); }
};

// parse_options iterates argv[start..argc-1], dispatches each recognised flag to its
// handler and returns the populated config with every parse error collected.
// Unknown flags, missing values, failed handlers and stray positional tokens are errors;
// parsing continues past them so all problems are reported at once.
template <typename Config>
ParsedOptions<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 1,
                                    Config default_config = {}) {
  ParsedOptions<Config> parsed{std::move(default_config), {}};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it == option_map.end()) {
      parsed.errors.push_back(
          (!arg.empty() && arg[0] == '-' ? "Unknown option: " : "Unexpected argument: ") + arg);
      continue;
    }

    const Option<Config>* opt = it->second;
    std::string value;
    if (opt->requires_value) {
      if (i + 1 >= argc) {
        parsed.errors.push_back("Option " + arg + " requires a value");
        continue;
      }
      value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }
    if (!opt->handler(parsed.config, value)) {
      parsed.errors.push_back("Invalid value for " + arg + ": " + value);
    }
  }

  return parsed;
}

// print_usage writes one line per option, in registration order.
template <typename Config>
void print_usage(std::ostream& out, const std::string& program,
                 const std::vector<Option<Config>>& options) {
  out << "Usage: " << program << " [options]\n";
  for (const auto& opt : options) {
    out << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "\n      "
        << opt.description << "\n";
  }
}

}  // namespace cqa::apps
