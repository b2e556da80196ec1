#include "cqa/engine/quality_report.h"

namespace cqa::engine {

IssueCounts count_issues(const std::vector<rules::Issue>& issues) {
  IssueCounts counts{};
  for (const auto& issue : issues) {
    switch (issue.severity) {
      case core::Severity::kCritical:
        ++counts.critical;
        break;
      case core::Severity::kHigh:
        ++counts.high;
        break;
      case core::Severity::kMedium:
        ++counts.medium;
        break;
      case core::Severity::kLow:
        ++counts.low;
        break;
    }
  }
  return counts;
}

bool passes_gate(const QualityReport& report, const double min_score) {
  return report.display_score >= min_score && report.counts.critical == 0;
}

}  // namespace cqa::engine
