#pragma once

#include "cqa/config/rule_configuration.h"
#include "cqa/core/taxonomy.h"
#include "cqa/extract/structural_element.h"
#include "cqa/source/line_scanner.h"
#include "cqa/source/source_unit.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace cqa::rules {

// RuleContext is the read-only input every rule predicate receives.
// This is a non-owning view; the caller must keep the referenced facts alive for the
// duration of the evaluation.
struct RuleContext {
  const source::SourceUnit& unit;
  const source::ScannedSource& scanned;
  const std::vector<extract::StructuralElement>& elements;
  const config::RuleThresholds& thresholds;
};

// RuleMatch is one match site reported by a predicate.
// An empty suggestion means "use the rule's default suggestion".
struct RuleMatch {
  int line{0};
  std::string message;
  std::string evidence;
  std::optional<std::string> suggestion;
};

using RulePredicate = std::function<std::vector<RuleMatch>(const RuleContext&)>;

// Rule is a tagged record rather than a class hierarchy: configuration can change
// severity or disable a rule without subclassing.
//
// Predicates must be pure: the same context yields the same matches on every call, and
// no predicate reads another rule's output or any shared mutable state.
struct Rule {
  std::string rule_id;
  std::string title;
  core::Category category{core::Category::kStructure};
  core::Severity severity{core::Severity::kLow};
  std::string description;
  std::string suggestion;
  RulePredicate evaluate;
};

}  // namespace cqa::rules
