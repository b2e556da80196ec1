#include "cqa/report/report_json.h"

#include <utility>

namespace cqa::report {

namespace {

using json = nlohmann::json;

json issue_to_json(const rules::Issue& issue) {
  json j;
  j["category"] = core::category_to_string(issue.category);
  j["evidence"] = issue.evidence;
  j["line"] = issue.line;
  j["message"] = issue.message;
  j["rule_id"] = issue.rule_id;
  j["severity"] = core::severity_to_string(issue.severity);
  if (issue.suggestion.has_value()) {
    j["suggestion"] = issue.suggestion.value();
  } else {
    j["suggestion"] = nullptr;
  }
  j["title"] = issue.title;
  return j;
}

json metrics_to_json(const extract::SourceMetrics& metrics) {
  json j;
  j["average_function_length"] = metrics.average_function_length;
  j["blank_lines"] = metrics.blank_lines;
  j["class_count"] = metrics.class_count;
  j["comment_lines"] = metrics.comment_lines;
  j["function_count"] = metrics.function_count;
  j["max_function_length"] = metrics.max_function_length;
  j["total_lines"] = metrics.total_lines;
  return j;
}

}  // namespace

json report_to_json(const engine::QualityReport& report) {
  json categories = json::array();
  for (const auto& score : report.category_scores) {
    json entry;
    entry["category"] = core::category_to_string(score.category);
    entry["issue_count"] = score.issue_count;
    entry["score"] = score.score;
    entry["weight"] = score.weight;
    categories.push_back(std::move(entry));
  }

  json issues = json::array();
  for (const auto& issue : report.issues) {
    issues.push_back(issue_to_json(issue));
  }

  json counts;
  counts["critical"] = report.counts.critical;
  counts["high"] = report.counts.high;
  counts["medium"] = report.counts.medium;
  counts["low"] = report.counts.low;
  counts["total"] = report.counts.total();

  json j;
  j["category_scores"] = std::move(categories);
  j["counts"] = std::move(counts);
  j["display_score"] = report.display_score;
  j["file"] = report.source_name;
  j["issues"] = std::move(issues);
  j["metrics"] = metrics_to_json(report.metrics);
  j["overall"] = report.overall;
  j["production_ready"] = engine::production_ready(report.verdict);
  j["verdict"] = engine::verdict_to_string(report.verdict);
  j["verdict_label"] = engine::verdict_label(report.verdict);
  return j;
}

json reports_to_json(const std::vector<engine::QualityReport>& reports, const double min_score) {
  json files = json::array();
  bool passed = true;
  for (const auto& report : reports) {
    json entry = report_to_json(report);
    const bool gate = engine::passes_gate(report, min_score);
    entry["passes_gate"] = gate;
    passed = passed && gate;
    files.push_back(std::move(entry));
  }

  json j;
  j["files"] = std::move(files);
  j["min_score"] = min_score;
  j["passed"] = passed;
  return j;
}

}  // namespace cqa::report
