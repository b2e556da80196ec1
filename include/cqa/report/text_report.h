#pragma once

#include "cqa/engine/quality_report.h"

#include <cstddef>
#include <string>

namespace cqa::report {

// Five-band rating of a display score: "*****" (>= 9), "****-" (>= 7), "***--" (>= 5),
// "**---" (>= 3), "*----".
[[nodiscard]] std::string star_rating(double score);

// render_text_report formats a console summary: overall score and rating, category
// scores, metrics, issues grouped by severity (at most max_per_severity shown per
// group) and the verdict line.
[[nodiscard]] std::string render_text_report(const engine::QualityReport& report,
                                             std::size_t max_per_severity = 5);

}  // namespace cqa::report
