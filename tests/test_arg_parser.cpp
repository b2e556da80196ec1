#include "cqa_cli/cli_config.h"
#include "shared/arg_parser.h"

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace cqa;

namespace {

// Owns argv storage for parse_options.
struct Argv {
  explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
    for (auto& arg : storage) {
      pointers.push_back(arg.data());
    }
  }
  int argc() const { return static_cast<int>(pointers.size()); }
  char** argv() { return pointers.data(); }

  std::vector<std::string> storage;
  std::vector<char*> pointers;
};

apps::ParsedOptions<cli::CliConfig> parse(std::vector<std::string> args) {
  args.insert(args.begin(), "cqa_cli");
  Argv argv(std::move(args));
  return apps::parse_options(argv.argc(), argv.argv(), cli::build_option_registry());
}

}  // namespace

TEST_CASE("CLI flags populate the configuration", "[cli][args]") {
  const auto parsed = parse({"--file", "a.py", "--file", "b.py", "--directory", "src", "--json",
                             "--strict", "--min-score", "8.5", "--max-issues", "3", "--config",
                             "rules.json", "--output", "report.json"});
  REQUIRE(parsed.ok());
  const auto& config = parsed.config;
  CHECK(config.files == std::vector<std::string>{"a.py", "b.py"});
  CHECK(config.directory == std::optional<std::string>{"src"});
  CHECK(config.json);
  CHECK(config.strict);
  CHECK(config.min_score == 8.5);
  CHECK(config.max_issues_per_severity == 3);
  CHECK(config.config_path == std::optional<std::string>{"rules.json"});
  CHECK(config.output_path == std::optional<std::string>{"report.json"});
  CHECK(cli::validate_cli_config(config).empty());
}

TEST_CASE("CLI defaults apply when flags are absent", "[cli][args]") {
  const auto parsed = parse({"--file", "a.py"});
  REQUIRE(parsed.ok());
  CHECK(parsed.config.min_score == 7.0);
  CHECK(parsed.config.max_issues_per_severity == 5);
  CHECK_FALSE(parsed.config.json);
  CHECK_FALSE(parsed.config.help);
}

TEST_CASE("CLI parser collects every error", "[cli][args]") {
  const auto parsed =
      parse({"--bogus", "stray", "--min-score", "11", "--max-issues", "-1", "--file"});
  REQUIRE(parsed.errors.size() == 5);
  CHECK(parsed.errors[0] == "Unknown option: --bogus");
  CHECK(parsed.errors[1] == "Unexpected argument: stray");
  CHECK(parsed.errors[2] == "Invalid value for --min-score: 11");
  CHECK(parsed.errors[3] == "Invalid value for --max-issues: -1");
  CHECK(parsed.errors[4] == "Option --file requires a value");
}

TEST_CASE("CLI rejects malformed numbers", "[cli][args]") {
  CHECK_FALSE(parse({"--min-score", "seven"}).ok());
  CHECK_FALSE(parse({"--min-score", "7.0x"}).ok());
  CHECK_FALSE(parse({"--max-issues", "2.5"}).ok());
}

TEST_CASE("validate_cli_config requires something to analyze", "[cli][args]") {
  const auto parsed = parse({"--json"});
  REQUIRE(parsed.ok());
  CHECK(cli::validate_cli_config(parsed.config) ==
        "Error: nothing to analyze; pass --file <path> or --directory <dir>");
}

TEST_CASE("print_usage lists options in registration order", "[cli][args]") {
  std::ostringstream out;
  apps::print_usage(out, "cqa_cli", cli::build_option_registry());
  const std::string usage = out.str();
  CHECK(usage.starts_with("Usage: cqa_cli [options]\n"));
  CHECK(usage.find("--file <value>") < usage.find("--directory <value>"));
  CHECK(usage.find("  --json\n") != std::string::npos);
}
