#pragma once

#include "cqa/config/rule_configuration.h"
#include "cqa/core/result.h"
#include "cqa/engine/quality_report.h"
#include "cqa/rules/rule_catalog.h"
#include "cqa/scoring/presets.h"
#include "cqa/scoring/scoring_policy.h"
#include "cqa/source/source_unit.h"

#include <string>

namespace cqa::engine {

// analyze runs the full pipeline on one source unit:
// extraction, rule evaluation, category aggregation, overall score, verdict.
//
// Pure: no hidden state, no I/O, safe to call concurrently on independent units with a
// shared catalog and policy. Undecomposable input yields a degraded report holding one
// critical "Unparsable Source" issue; it never throws for bad input.
[[nodiscard]] QualityReport analyze(
    const source::SourceUnit& unit, const rules::RuleCatalog& catalog,
    const config::RuleThresholds& thresholds = {},
    const scoring::ScoringPolicy& policy = scoring::default_scoring_policy());

// unreadable_report is the degraded report for a source that could not be read at all
// (missing file, permission error): one critical "Unparsable Source" issue at line 0 and
// empty metrics.
[[nodiscard]] QualityReport unreadable_report(
    std::string source_name, const std::string& reason,
    const scoring::ScoringPolicy& policy = scoring::default_scoring_policy());

// AnalysisEngine binds a validated catalog, thresholds and scoring policy.
// Construction is the only place configuration errors surface; once created the engine
// is immutable and analyze() may run from many threads at once.
class AnalysisEngine {
 public:
  [[nodiscard]] static core::Result<AnalysisEngine, core::ConfigError> create(
      const config::RuleConfiguration& config,
      const scoring::ScoringPolicy& policy = scoring::default_scoring_policy(),
      const rules::RuleCatalog& catalog = rules::make_default_catalog());

  [[nodiscard]] QualityReport analyze(const source::SourceUnit& unit) const;
  [[nodiscard]] QualityReport unreadable(std::string source_name, const std::string& reason) const;

  [[nodiscard]] const rules::RuleCatalog& catalog() const noexcept { return catalog_; }
  [[nodiscard]] const config::RuleThresholds& thresholds() const noexcept { return thresholds_; }
  [[nodiscard]] const scoring::ScoringPolicy& policy() const noexcept { return policy_; }

 private:
  AnalysisEngine(rules::RuleCatalog catalog, config::RuleThresholds thresholds,
                 scoring::ScoringPolicy policy);

  rules::RuleCatalog catalog_;
  config::RuleThresholds thresholds_;
  scoring::ScoringPolicy policy_;
};

}  // namespace cqa::engine
