#include "cqa/config/config_json.h"
#include "cqa/core/version.h"
#include "cqa/engine/analysis_engine.h"
#include "cqa/report/report_json.h"
#include "cqa/report/text_report.h"
#include "cqa/scoring/presets.h"
#include "cqa/source/source_loader.h"

#include <nlohmann/json.hpp>

#include "cli_config.h"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

using namespace cqa;

namespace {

constexpr int kExitPass = 0;
constexpr int kExitGateFailed = 1;
constexpr int kExitUsage = 2;

// Rule configuration from --config, or the defaults when the flag is absent.
core::Result<config::RuleConfiguration, std::string> load_rule_configuration(
    const cli::CliConfig& cli) {
  using ConfigResult = core::Result<config::RuleConfiguration, std::string>;
  if (!cli.config_path.has_value()) {
    return ConfigResult::ok(config::RuleConfiguration{});
  }

  std::ifstream file(cli.config_path.value(), std::ios::binary);
  if (!file.is_open()) {
    return ConfigResult::err("cannot open configuration " + cli.config_path.value());
  }
  const std::string text{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};

  auto parsed = config::rule_configuration_from_json(text);
  if (!parsed.has_value()) {
    return ConfigResult::err(cli.config_path.value() + ": " + core::describe(parsed.error()));
  }
  return ConfigResult::ok(parsed.take_value());
}

// --file paths plus the .py files under --directory, sorted and de-duplicated.
core::Result<std::vector<std::string>, std::string> collect_paths(const cli::CliConfig& cli) {
  using PathsResult = core::Result<std::vector<std::string>, std::string>;
  std::vector<std::string> paths = cli.files;

  if (cli.directory.has_value()) {
    auto discovered = source::discover_python_files(cli.directory.value());
    if (!discovered.has_value()) {
      return PathsResult::err(discovered.error());
    }
    const auto& found = discovered.value();
    paths.insert(paths.end(), found.begin(), found.end());
  }

  std::sort(paths.begin(), paths.end());
  paths.erase(std::unique(paths.begin(), paths.end()), paths.end());
  return PathsResult::ok(std::move(paths));
}

std::string dump_json(const nlohmann::json& j) {
  // Evidence is copied from analyzed text; never let a stray byte abort the export.
  return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

int main(int argc, char* argv[]) {
  const auto options = cli::build_option_registry();
  const auto parsed = apps::parse_options(argc, argv, options);

  if (parsed.config.help) {
    apps::print_usage(std::cout, "cqa_cli", options);
    return kExitPass;
  }
  if (!parsed.ok()) {
    for (const auto& error : parsed.errors) {
      std::cerr << "Error: " << error << "\n";
    }
    apps::print_usage(std::cerr, "cqa_cli", options);
    return kExitUsage;
  }

  const cli::CliConfig& cli = parsed.config;
  const std::string config_error = cli::validate_cli_config(cli);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return kExitUsage;
  }

  auto rule_config = load_rule_configuration(cli);
  if (!rule_config.has_value()) {
    std::cerr << "Error: " << rule_config.error() << "\n";
    return kExitUsage;
  }

  // Configuration errors surface here, before any file is read.
  const scoring::ScoringPolicy policy =
      cli.strict ? scoring::strict_scoring_policy() : scoring::default_scoring_policy();
  auto created = engine::AnalysisEngine::create(rule_config.value(), policy);
  if (!created.has_value()) {
    std::cerr << "Error: invalid configuration: " << core::describe(created.error()) << "\n";
    return kExitUsage;
  }
  const engine::AnalysisEngine analysis_engine = created.take_value();

  auto paths = collect_paths(cli);
  if (!paths.has_value()) {
    std::cerr << "Error: " << paths.error() << "\n";
    return kExitUsage;
  }

  // ── Startup diagnostic block ──────────────────────────────────────────────
  std::cerr << "cqa v" << core::kBuildVersion << "\n";
  std::cerr << "Scoring:  " << scoring::policy_to_log_string(analysis_engine.policy()) << "\n";
  std::cerr << "Rules:    " << analysis_engine.catalog().size() << " enabled\n";
  std::cerr << "Analyzing " << paths.value().size() << " file(s)\n";

  std::vector<engine::QualityReport> reports;
  reports.reserve(paths.value().size());
  for (const auto& path : paths.value()) {
    auto unit = source::load_source_file(path);
    if (!unit.has_value()) {
      // One unreadable file degrades its own report; the batch continues.
      std::cerr << "Error: " << unit.error() << "\n";
      reports.push_back(analysis_engine.unreadable(path, unit.error()));
      continue;
    }
    reports.push_back(analysis_engine.analyze(unit.value()));
  }

  const nlohmann::json batch = report::reports_to_json(reports, cli.min_score);

  if (cli.json) {
    std::cout << dump_json(batch) << "\n";
  } else {
    for (const auto& report : reports) {
      std::cout << report::render_text_report(report, cli.max_issues_per_severity) << "\n";
    }
  }

  if (cli.output_path.has_value()) {
    std::ofstream out(cli.output_path.value(), std::ios::binary | std::ios::trunc);
    if (!out.is_open() || !(out << dump_json(batch) << "\n")) {
      std::cerr << "Error: cannot write report to " << cli.output_path.value() << "\n";
      return kExitUsage;
    }
    std::cerr << "Report written to " << cli.output_path.value() << "\n";
  }

  const bool passed = std::all_of(reports.begin(), reports.end(), [&](const auto& report) {
    return engine::passes_gate(report, cli.min_score);
  });
  return passed ? kExitPass : kExitGateFailed;
}
