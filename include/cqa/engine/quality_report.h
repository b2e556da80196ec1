#pragma once

#include "cqa/engine/verdict.h"
#include "cqa/extract/structural_element.h"
#include "cqa/rules/issue.h"
#include "cqa/scoring/category_score.h"

#include <cstddef>
#include <string>
#include <vector>

namespace cqa::engine {

struct IssueCounts {
  std::size_t critical{0};
  std::size_t high{0};
  std::size_t medium{0};
  std::size_t low{0};

  [[nodiscard]] std::size_t total() const noexcept { return critical + high + medium + low; }
};

[[nodiscard]] IssueCounts count_issues(const std::vector<rules::Issue>& issues);

// QualityReport is the single output of one analysis. Immutable once produced.
struct QualityReport {
  std::string source_name;
  double overall{10.0};        // Full precision, within [0, 10]
  double display_score{10.0};  // overall rounded to one decimal; drives the verdict
  std::vector<scoring::CategoryScore> category_scores;  // All six, canonical order
  std::vector<rules::Issue> issues;                     // Report order
  extract::SourceMetrics metrics;
  Verdict verdict{Verdict::kExcellent};
  IssueCounts counts;
};

// passes_gate: display_score >= min_score and no critical issue. Used for CI gating.
// Compares the same rounded score the verdict is classified on.
[[nodiscard]] bool passes_gate(const QualityReport& report, double min_score);

}  // namespace cqa::engine
