#pragma once

#include "cqa/rules/issue.h"
#include "cqa/scoring/category_score.h"
#include "cqa/scoring/scoring_policy.h"

#include <vector>

namespace cqa::scoring {

inline constexpr double kMaxScore = 10.0;
inline constexpr double kMinScore = 0.0;

// aggregate_categories returns one CategoryScore per category in canonical order
// (core::kAllCategories), whether or not the category has issues.
//
// score = clamp(10 - sum over severities of count * penalty, 0, 10). The deduction is
// computed from per-severity counts, so the result does not depend on issue order.
// A category absent from the policy gets weight 0 and default penalties; callers pass a
// policy that has been through validate_policy.
[[nodiscard]] std::vector<CategoryScore> aggregate_categories(
    const std::vector<rules::Issue>& issues, const ScoringPolicy& policy);

}  // namespace cqa::scoring
