#pragma once

#include "cqa/engine/quality_report.h"

#include <nlohmann/json.hpp>

#include <vector>

namespace cqa::report {

// report_to_json builds the structured export of one report. nlohmann::json objects are
// std::map backed, so keys are sorted and dump() is byte-stable for equal reports.
//
// Layout:
//   {"category_scores": [{"category", "issue_count", "score", "weight"}...],
//    "counts": {"critical", "high", "medium", "low", "total"},
//    "display_score", "file", "issues": [...], "metrics": {...}, "overall",
//    "production_ready", "verdict", "verdict_label"}
[[nodiscard]] nlohmann::json report_to_json(const engine::QualityReport& report);

// Batch export: {"files": [...], "min_score", "passed"}. Each file entry carries its own
// "passes_gate"; there is no cross-file scoring.
[[nodiscard]] nlohmann::json reports_to_json(const std::vector<engine::QualityReport>& reports,
                                             double min_score);

}  // namespace cqa::report
