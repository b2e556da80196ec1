#include "cqa/report/text_report.h"

#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace cqa::report {

namespace {

const std::string kRule(80, '=');

std::string uppercase(const std::string& text) {
  std::string result = text;
  for (char& ch : result) {
    if (ch >= 'a' && ch <= 'z') {
      ch = static_cast<char>(ch - ('a' - 'A'));
    }
  }
  return result;
}

}  // namespace

std::string star_rating(const double score) {
  if (score >= 9.0) {
    return "*****";
  }
  if (score >= 7.0) {
    return "****-";
  }
  if (score >= 5.0) {
    return "***--";
  }
  if (score >= 3.0) {
    return "**---";
  }
  return "*----";
}

std::string render_text_report(const engine::QualityReport& report,
                               const std::size_t max_per_severity) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(1);

  out << kRule << "\n";
  out << "CODE QUALITY REPORT - " << report.source_name << "\n";
  out << kRule << "\n\n";

  out << "Overall Quality Score: " << report.display_score << "/10 "
      << star_rating(report.display_score) << "\n\n";

  out << "Category Scores:\n";
  for (const auto& score : report.category_scores) {
    out << "  - " << core::category_display_name(score.category) << ": " << score.score
        << "/10\n";
  }

  const auto& metrics = report.metrics;
  out << "\nCode Metrics:\n";
  out << "  - Lines of Code: " << metrics.total_lines << "\n";
  out << "  - Blank Lines: " << metrics.blank_lines << "\n";
  out << "  - Comment Lines: " << metrics.comment_lines << "\n";
  out << "  - Functions: " << metrics.function_count << "\n";
  out << "  - Classes: " << metrics.class_count << "\n";
  if (metrics.function_count > 0) {
    out << "  - Avg Function Length: " << metrics.average_function_length << " lines\n";
    out << "  - Max Function Length: " << metrics.max_function_length << " lines\n";
  }

  out << "\nIssues Found: " << report.issues.size() << "\n";
  for (const auto severity : core::kSeveritiesDescending) {
    std::vector<const rules::Issue*> group;
    for (const auto& issue : report.issues) {
      if (issue.severity == severity) {
        group.push_back(&issue);
      }
    }
    if (group.empty()) {
      continue;
    }

    out << "\n  " << uppercase(core::severity_to_string(severity)) << " (" << group.size()
        << "):\n";
    for (std::size_t i = 0; i < group.size() && i < max_per_severity; ++i) {
      const rules::Issue& issue = *group[i];
      out << "    - ";
      if (issue.line > 0) {
        out << "Line " << issue.line << ": ";
      }
      out << issue.title << " [" << issue.rule_id << "]\n";
      out << "      " << issue.message << "\n";
    }
    if (group.size() > max_per_severity) {
      out << "    ... and " << group.size() - max_per_severity << " more\n";
    }
  }

  out << "\n" << kRule << "\n";
  out << "Verdict: " << engine::verdict_label(report.verdict) << "\n";
  out << kRule << "\n";
  return out.str();
}

}  // namespace cqa::report
