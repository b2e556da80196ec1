#pragma once

#include "cqa/core/result.h"
#include "cqa/core/taxonomy.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cqa::scoring {

// Points deducted from a category's 10.0 per issue of each severity.
struct SeverityPenalties {
  double critical{4.0};
  double high{2.0};
  double medium{1.0};
  double low{0.3};

  [[nodiscard]] double for_severity(core::Severity severity) const noexcept;
};

struct CategoryPolicy {
  core::Category category{core::Category::kStructure};
  double weight{0.0};
  SeverityPenalties penalties;
};

// ScoringPolicy is fixed when an engine is built and never changes afterwards.
// A valid policy lists each of the six categories exactly once with a weight in
// (0, 1], weights summing to 1.0 within kWeightSumTolerance, and non-negative penalties.
struct ScoringPolicy {
  std::vector<CategoryPolicy> categories;

  [[nodiscard]] const CategoryPolicy* find(core::Category category) const noexcept;
};

inline constexpr double kWeightSumTolerance = 1e-9;

[[nodiscard]] std::optional<core::ConfigError> validate_policy(const ScoringPolicy& policy);

// apply_weight_overrides replaces the weights of the listed categories and re-validates.
// Overrides that break the weight sum are rejected, never renormalized.
[[nodiscard]] core::Result<ScoringPolicy, core::ConfigError> apply_weight_overrides(
    const ScoringPolicy& policy, const std::map<core::Category, double>& overrides);

// policy_to_log_string returns a deterministic one-line summary for startup diagnostics.
// Format: "structure=0.20(4.0/2.0/1.0/0.3) error_handling=0.20(...) ..."
[[nodiscard]] std::string policy_to_log_string(const ScoringPolicy& policy);

}  // namespace cqa::scoring
