#include "cqa/scoring/category_aggregator.h"

#include <algorithm>
#include <array>
#include <cstddef>

namespace cqa::scoring {

namespace {

constexpr std::size_t kCategoryCount = core::kAllCategories.size();
constexpr std::size_t kSeverityCount = core::kSeveritiesDescending.size();

using SeverityCounts = std::array<std::size_t, kSeverityCount>;

}  // namespace

std::vector<CategoryScore> aggregate_categories(const std::vector<rules::Issue>& issues,
                                                const ScoringPolicy& policy) {
  std::array<SeverityCounts, kCategoryCount> counts{};
  for (const auto& issue : issues) {
    ++counts[static_cast<std::size_t>(issue.category)][static_cast<std::size_t>(issue.severity)];
  }

  std::vector<CategoryScore> scores;
  scores.reserve(kCategoryCount);
  for (const auto category : core::kAllCategories) {
    const CategoryPolicy* entry = policy.find(category);
    const SeverityPenalties penalties = entry != nullptr ? entry->penalties : SeverityPenalties{};

    const auto& per_severity = counts[static_cast<std::size_t>(category)];
    double deduction = 0.0;
    std::size_t total = 0;
    // Fixed summation order keeps the result bit-identical for any issue order
    for (const auto severity : core::kSeveritiesDescending) {
      const std::size_t count = per_severity[static_cast<std::size_t>(severity)];
      deduction += static_cast<double>(count) * penalties.for_severity(severity);
      total += count;
    }

    CategoryScore score{};
    score.category = category;
    score.weight = entry != nullptr ? entry->weight : 0.0;
    score.score = std::clamp(kMaxScore - deduction, kMinScore, kMaxScore);
    score.issue_count = total;
    scores.push_back(score);
  }
  return scores;
}

}  // namespace cqa::scoring
