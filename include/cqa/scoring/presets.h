#pragma once

#include "cqa/scoring/scoring_policy.h"

namespace cqa::scoring {

inline ScoringPolicy default_scoring_policy() {
  return ScoringPolicy{{
      CategoryPolicy{core::Category::kStructure, 0.20, SeverityPenalties{}},
      CategoryPolicy{core::Category::kErrorHandling, 0.20, SeverityPenalties{}},
      CategoryPolicy{core::Category::kPerformance, 0.15, SeverityPenalties{}},
      CategoryPolicy{core::Category::kSecurity, 0.15, SeverityPenalties{}},
      CategoryPolicy{core::Category::kMaintainability, 0.15, SeverityPenalties{}},
      CategoryPolicy{core::Category::kBestPractices, 0.15, SeverityPenalties{}},
  }};
}

// Same weights, every penalty doubled. Used for release gates.
inline ScoringPolicy strict_scoring_policy() {
  ScoringPolicy policy = default_scoring_policy();
  for (auto& category : policy.categories) {
    category.penalties = SeverityPenalties{8.0, 4.0, 2.0, 0.6};
  }
  return policy;
}

}  // namespace cqa::scoring
