#pragma once

#include "cqa/config/rule_configuration.h"
#include "cqa/core/result.h"

#include <string>
#include <string_view>

namespace cqa::config {

// rule_configuration_from_json parses a JSON rule configuration:
//
//   {
//     "thresholds": {"max_function_length": 80, "require_type_hints": false},
//     "rules":      {"BP-001": {"enabled": false}, "ERR-003": {"severity": "low"}},
//     "weights":    {"structure": 0.25, "best_practices": 0.10}
//   }
//
// Every section and field is optional; absent fields keep their defaults. Malformed JSON,
// unknown keys, wrong value types, unknown severity or category names are reported as
// kInvalidFormat. Rule ids and weight sums are checked later, against the catalog and
// scoring policy (see AnalysisEngine::create).
[[nodiscard]] core::Result<RuleConfiguration, core::ConfigError> rule_configuration_from_json(
    std::string_view text);

// rule_configuration_to_json serializes with sorted keys; thresholds are always written
// in full, so the output reloads to an equal configuration.
[[nodiscard]] std::string rule_configuration_to_json(const RuleConfiguration& config);

}  // namespace cqa::config
