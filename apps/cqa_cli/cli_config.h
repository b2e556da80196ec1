#pragma once

#include "../shared/arg_parser.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cqa::cli {

// CliConfig holds all parsed flags of cqa_cli.
// Every field has an explicit default; optional fields mean "not configured".
struct CliConfig {
  std::vector<std::string> files;           // NOLINT(readability-identifier-naming)
  std::optional<std::string> directory;     // NOLINT(readability-identifier-naming)
  std::optional<std::string> config_path;   // NOLINT(readability-identifier-naming)
  std::optional<std::string> output_path;   // NOLINT(readability-identifier-naming)
  bool json{false};                         // NOLINT(readability-identifier-naming)
  bool strict{false};                       // NOLINT(readability-identifier-naming)
  bool help{false};                         // NOLINT(readability-identifier-naming)
  double min_score{7.0};                    // NOLINT(readability-identifier-naming)
  std::size_t max_issues_per_severity{5};   // NOLINT(readability-identifier-naming)
};

[[nodiscard]] std::vector<apps::Option<CliConfig>> build_option_registry();

// validate_cli_config returns an error message, or "" when the flags are usable.
[[nodiscard]] std::string validate_cli_config(const CliConfig& config);

}  // namespace cqa::cli
