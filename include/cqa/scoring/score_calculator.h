#pragma once

#include "cqa/scoring/category_score.h"

#include <vector>

namespace cqa::scoring {

// compute_overall returns the weighted sum of the category scores, clamped to [0, 10]
// and to [min, max] of the individual scores (floating error never pushes the
// aggregate outside the range of its inputs). Returns 0 for an empty list.
[[nodiscard]] double compute_overall(const std::vector<CategoryScore>& scores);

// round_to_tenth: the one-decimal display score (half away from zero).
[[nodiscard]] double round_to_tenth(double value);

}  // namespace cqa::scoring
