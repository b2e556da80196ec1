#include "cqa/scoring/score_calculator.h"

#include "cqa/scoring/category_aggregator.h"

#include <algorithm>
#include <cmath>

namespace cqa::scoring {

double compute_overall(const std::vector<CategoryScore>& scores) {
  if (scores.empty()) {
    return kMinScore;
  }

  double weighted = 0.0;
  for (const auto& entry : scores) {
    weighted += entry.score * entry.weight;
  }

  const auto [lowest, highest] = std::minmax_element(
      scores.begin(), scores.end(),
      [](const CategoryScore& a, const CategoryScore& b) { return a.score < b.score; });

  weighted = std::clamp(weighted, kMinScore, kMaxScore);
  return std::clamp(weighted, lowest->score, highest->score);
}

double round_to_tenth(const double value) { return std::round(value * 10.0) / 10.0; }

}  // namespace cqa::scoring
