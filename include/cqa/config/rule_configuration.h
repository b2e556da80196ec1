#pragma once

#include "cqa/core/taxonomy.h"

#include <map>
#include <string>

namespace cqa::config {

// RuleThresholds holds the tunable limits read by structural and style rules.
// Every field has an explicit default.
struct RuleThresholds {
  int max_function_length{100};  // Longer functions are flagged (high)
  int warn_function_length{50};  // Longer functions are warned about (medium)
  int max_nesting_depth{4};
  int max_class_methods{20};
  int max_complexity{10};
  int max_line_length{120};
  bool require_docstrings{true};
  bool require_type_hints{true};
};

// RuleConfiguration is the caller-supplied override layer applied before analysis.
// Empty maps mean "keep catalog defaults". Rule ids must exist in the catalog and
// weight overrides must leave the category weights summing to 1.0, otherwise the
// configuration is rejected before any analysis runs.
struct RuleConfiguration {
  RuleThresholds thresholds;
  std::map<std::string, bool> enabled;                       // rule id -> enabled
  std::map<std::string, core::Severity> severity_overrides;  // rule id -> severity
  std::map<core::Category, double> weight_overrides;         // category -> weight
};

}  // namespace cqa::config
