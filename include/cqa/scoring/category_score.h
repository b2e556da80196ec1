#pragma once

#include "cqa/core/taxonomy.h"

#include <cstddef>

namespace cqa::scoring {

// Score of one quality dimension. score is always within [0, 10].
struct CategoryScore {
  core::Category category{core::Category::kStructure};
  double weight{0.0};
  double score{10.0};
  std::size_t issue_count{0};
};

}  // namespace cqa::scoring
