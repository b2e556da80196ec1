#include "cqa/config/config_json.h"

#include <catch2/catch_test_macros.hpp>

using namespace cqa;
using namespace cqa::config;

TEST_CASE("Empty configuration keeps every default", "[config][json]") {
  auto result = rule_configuration_from_json("{}");
  REQUIRE(result.has_value());
  const auto config = result.take_value();
  CHECK(config.thresholds.max_function_length == 100);
  CHECK(config.thresholds.max_line_length == 120);
  CHECK(config.thresholds.require_docstrings);
  CHECK(config.enabled.empty());
  CHECK(config.severity_overrides.empty());
  CHECK(config.weight_overrides.empty());
}

TEST_CASE("Configuration sections are parsed", "[config][json]") {
  auto result = rule_configuration_from_json(R"({
    "thresholds": {"max_function_length": 80, "require_type_hints": false},
    "rules": {"BP-001": {"enabled": false}, "ERR-003": {"severity": "low"}},
    "weights": {"structure": 0.25, "best_practices": 0.10}
  })");
  REQUIRE(result.has_value());
  const auto config = result.take_value();
  CHECK(config.thresholds.max_function_length == 80);
  CHECK(config.thresholds.warn_function_length == 50);
  CHECK_FALSE(config.thresholds.require_type_hints);
  CHECK(config.enabled.at("BP-001") == false);
  CHECK(config.severity_overrides.at("ERR-003") == core::Severity::kLow);
  CHECK(config.weight_overrides.at(core::Category::kStructure) == 0.25);
  CHECK(config.weight_overrides.at(core::Category::kBestPractices) == 0.10);
}

TEST_CASE("Malformed configuration is an invalid-format error", "[config][json]") {
  const char* const bad_inputs[] = {
      "{not json",
      "[1, 2]",
      R"({"colours": {}})",
      R"({"thresholds": {"max_line_length": "long"}})",
      R"({"thresholds": {"max_line_length": 1.5}})",
      R"({"thresholds": {"line_limit": 80}})",
      R"({"thresholds": {"require_docstrings": 1}})",
      R"({"rules": {"BP-001": true}})",
      R"({"rules": {"BP-001": {"enabled": "no"}}})",
      R"({"rules": {"BP-001": {"severity": "urgent"}}})",
      R"({"rules": {"BP-001": {"priority": 1}}})",
      R"({"weights": {"style": 0.1}})",
      R"({"weights": {"security": "high"}})",
  };
  for (const char* input : bad_inputs) {
    INFO(input);
    const auto result = rule_configuration_from_json(input);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == core::ConfigErrorCode::kInvalidFormat);
  }
}

TEST_CASE("Unknown rule ids are left for the catalog to reject", "[config][json]") {
  const auto result = rule_configuration_from_json(R"({"rules": {"NOPE-1": {"enabled": true}}})");
  REQUIRE(result.has_value());
  CHECK(result.value().enabled.count("NOPE-1") == 1);
}

TEST_CASE("Serialized configuration reloads unchanged", "[config][json]") {
  RuleConfiguration config;
  config.thresholds.max_nesting_depth = 3;
  config.thresholds.require_docstrings = false;
  config.enabled["SEC-004"] = false;
  config.severity_overrides["BP-002"] = core::Severity::kMedium;
  config.weight_overrides[core::Category::kSecurity] = 0.2;

  const std::string text = rule_configuration_to_json(config);
  CHECK(text.find("\"max_nesting_depth\":3") != std::string::npos);

  auto reloaded = rule_configuration_from_json(text);
  REQUIRE(reloaded.has_value());
  const auto copy = reloaded.take_value();
  CHECK(copy.thresholds.max_nesting_depth == 3);
  CHECK_FALSE(copy.thresholds.require_docstrings);
  CHECK(copy.enabled == config.enabled);
  CHECK(copy.severity_overrides == config.severity_overrides);
  CHECK(copy.weight_overrides == config.weight_overrides);
  CHECK(rule_configuration_to_json(copy) == text);
}
