#include "cli_config.h"

#include <charconv>
#include <exception>
#include <string>

namespace cqa::cli {

namespace {

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

bool handle_file(CliConfig& config, const std::string& value) {
  config.files.push_back(value);
  return true;
}

bool handle_directory(CliConfig& config, const std::string& value) {
  config.directory = value;
  return true;
}

bool handle_config(CliConfig& config, const std::string& value) {
  config.config_path = value;
  return true;
}

bool handle_output(CliConfig& config, const std::string& value) {
  config.output_path = value;
  return true;
}

bool handle_json(CliConfig& config, const std::string& /*value*/) {
  config.json = true;
  return true;
}

bool handle_strict(CliConfig& config, const std::string& /*value*/) {
  config.strict = true;
  return true;
}

bool handle_help(CliConfig& config, const std::string& /*value*/) {
  config.help = true;
  return true;
}

bool handle_min_score(CliConfig& config, const std::string& value) {
  try {
    std::size_t consumed = 0;
    const double score = std::stod(value, &consumed);
    if (consumed != value.size() || score < 0.0 || score > 10.0) {
      return false;
    }
    config.min_score = score;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

bool handle_max_issues(CliConfig& config, const std::string& value) {
  std::size_t limit = 0;
  const auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), limit);
  if (ec != std::errc{} || end != value.data() + value.size()) {
    return false;
  }
  config.max_issues_per_severity = limit;
  return true;
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<apps::Option<CliConfig>> build_option_registry() {
  return {
      {"--file", true, "Python file to analyze (repeatable)", handle_file},
      {"--directory", true, "Directory searched recursively for .py files", handle_directory},
      {"--config", true, "JSON rule configuration", handle_config},
      {"--output", true, "Write the JSON report to this path", handle_output},
      {"--json", false, "Print the JSON report instead of the text summary", handle_json},
      {"--strict", false, "Use the strict scoring policy (doubled penalties)", handle_strict},
      {"--min-score", true, "Minimum displayed score for the gate (default 7.0)", handle_min_score},
      {"--max-issues", true, "Issues shown per severity in the text summary (default 5)",
       handle_max_issues},
      {"--help", false, "Show this help", handle_help},
  };
}

std::string validate_cli_config(const CliConfig& config) {
  if (config.files.empty() && !config.directory.has_value()) {
    return "Error: nothing to analyze; pass --file <path> or --directory <dir>";
  }
  return {};
}

}  // namespace cqa::cli
