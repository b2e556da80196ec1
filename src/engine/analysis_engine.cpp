#include "cqa/engine/analysis_engine.h"

#include "cqa/engine/rule_evaluator.h"
#include "cqa/extract/extractor.h"
#include "cqa/scoring/category_aggregator.h"
#include "cqa/scoring/score_calculator.h"

#include <utility>

namespace cqa::engine {

namespace {

// Aggregation, overall score and verdict over the issues already in the report.
void score_report(QualityReport& report, const scoring::ScoringPolicy& policy) {
  report.category_scores = scoring::aggregate_categories(report.issues, policy);
  report.overall = scoring::compute_overall(report.category_scores);
  report.display_score = scoring::round_to_tenth(report.overall);
  report.counts = count_issues(report.issues);
  report.verdict = classify(report.display_score, report.counts.critical, report.counts.high);
}

}  // namespace

QualityReport analyze(const source::SourceUnit& unit, const rules::RuleCatalog& catalog,
                      const config::RuleThresholds& thresholds,
                      const scoring::ScoringPolicy& policy) {
  QualityReport report{};
  report.source_name = unit.name();

  extract::ExtractionResult extraction = extract::extract_structure(unit);
  report.metrics = extraction.metrics;

  if (!extraction.ok()) {
    // Rules never see undecomposable input
    report.issues.push_back(make_unparsable_issue(*extraction.failure));
  } else {
    const rules::RuleContext context{unit, extraction.scanned, extraction.elements, thresholds};
    report.issues = evaluate_rules(catalog, context);
  }

  score_report(report, policy);
  return report;
}

QualityReport unreadable_report(std::string source_name, const std::string& reason,
                                const scoring::ScoringPolicy& policy) {
  QualityReport report{};
  report.source_name = std::move(source_name);
  report.issues.push_back(make_unparsable_issue(source::ScanError{0, reason}));
  score_report(report, policy);
  return report;
}

AnalysisEngine::AnalysisEngine(rules::RuleCatalog catalog, config::RuleThresholds thresholds,
                               scoring::ScoringPolicy policy)
    : catalog_(std::move(catalog)), thresholds_(thresholds), policy_(std::move(policy)) {}

core::Result<AnalysisEngine, core::ConfigError> AnalysisEngine::create(
    const config::RuleConfiguration& config, const scoring::ScoringPolicy& policy,
    const rules::RuleCatalog& catalog) {
  using EngineResult = core::Result<AnalysisEngine, core::ConfigError>;

  auto weighted = scoring::apply_weight_overrides(policy, config.weight_overrides);
  if (!weighted.has_value()) {
    return EngineResult::err(weighted.error());
  }

  auto configured = rules::apply_configuration(catalog, config);
  if (!configured.has_value()) {
    return EngineResult::err(configured.error());
  }

  return EngineResult::ok(
      AnalysisEngine(configured.take_value(), config.thresholds, weighted.take_value()));
}

QualityReport AnalysisEngine::analyze(const source::SourceUnit& unit) const {
  return engine::analyze(unit, catalog_, thresholds_, policy_);
}

QualityReport AnalysisEngine::unreadable(std::string source_name, const std::string& reason) const {
  return unreadable_report(std::move(source_name), reason, policy_);
}

}  // namespace cqa::engine
