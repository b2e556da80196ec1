#include "cqa/scoring/presets.h"
#include "cqa/scoring/scoring_policy.h"

#include <catch2/catch_test_macros.hpp>

using namespace cqa;
using namespace cqa::scoring;
using core::Category;
using core::ConfigErrorCode;

TEST_CASE("Preset policies are valid", "[scoring][policy]") {
  CHECK_FALSE(validate_policy(default_scoring_policy()).has_value());
  CHECK_FALSE(validate_policy(strict_scoring_policy()).has_value());

  const auto policy = default_scoring_policy();
  REQUIRE(policy.find(Category::kStructure) != nullptr);
  CHECK(policy.find(Category::kStructure)->weight == 0.20);
  CHECK(policy.find(Category::kSecurity)->weight == 0.15);
}

TEST_CASE("validate_policy reports each violation", "[scoring][policy]") {
  SECTION("missing category") {
    auto policy = default_scoring_policy();
    policy.categories.pop_back();
    const auto error = validate_policy(policy);
    REQUIRE(error.has_value());
    CHECK(error->code == ConfigErrorCode::kMissingCategory);
  }
  SECTION("duplicate category") {
    auto policy = default_scoring_policy();
    policy.categories.push_back(policy.categories.front());
    const auto error = validate_policy(policy);
    REQUIRE(error.has_value());
    CHECK(error->code == ConfigErrorCode::kDuplicateCategory);
  }
  SECTION("weight outside (0, 1]") {
    auto policy = default_scoring_policy();
    policy.categories[0].weight = 0.0;
    const auto error = validate_policy(policy);
    REQUIRE(error.has_value());
    CHECK(error->code == ConfigErrorCode::kWeightRange);
  }
  SECTION("negative penalty") {
    auto policy = default_scoring_policy();
    policy.categories[2].penalties.low = -0.1;
    const auto error = validate_policy(policy);
    REQUIRE(error.has_value());
    CHECK(error->code == ConfigErrorCode::kNegativePenalty);
  }
  SECTION("weights not summing to one") {
    auto policy = default_scoring_policy();
    policy.categories[0].weight = 0.30;
    const auto error = validate_policy(policy);
    REQUIRE(error.has_value());
    CHECK(error->code == ConfigErrorCode::kWeightSum);
  }
}

TEST_CASE("apply_weight_overrides keeps a valid sum", "[scoring][policy]") {
  const auto base = default_scoring_policy();
  auto result = apply_weight_overrides(
      base, {{Category::kStructure, 0.25}, {Category::kErrorHandling, 0.15}});
  REQUIRE(result.has_value());
  const auto updated = result.take_value();
  CHECK(updated.find(Category::kStructure)->weight == 0.25);
  CHECK(updated.find(Category::kErrorHandling)->weight == 0.15);
  // Input policy is untouched
  CHECK(base.find(Category::kStructure)->weight == 0.20);
}

TEST_CASE("apply_weight_overrides rejects a broken sum without renormalizing",
          "[scoring][policy]") {
  const auto result = apply_weight_overrides(default_scoring_policy(), {{Category::kSecurity, 0.5}});
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == ConfigErrorCode::kWeightSum);
}

TEST_CASE("apply_weight_overrides rejects categories the policy does not list",
          "[scoring][policy]") {
  auto policy = default_scoring_policy();
  policy.categories.pop_back();
  const auto result = apply_weight_overrides(policy, {{Category::kBestPractices, 0.15}});
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == ConfigErrorCode::kMissingCategory);
}

TEST_CASE("policy_to_log_string is deterministic", "[scoring][policy]") {
  CHECK(policy_to_log_string(default_scoring_policy()) ==
        "structure=0.20(4.0/2.0/1.0/0.3) error_handling=0.20(4.0/2.0/1.0/0.3) "
        "performance=0.15(4.0/2.0/1.0/0.3) security=0.15(4.0/2.0/1.0/0.3) "
        "maintainability=0.15(4.0/2.0/1.0/0.3) best_practices=0.15(4.0/2.0/1.0/0.3)");
  CHECK(policy_to_log_string(strict_scoring_policy()).starts_with(
      "structure=0.20(8.0/4.0/2.0/0.6) error_handling=0.20(8.0/4.0/2.0/0.6)"));
}
