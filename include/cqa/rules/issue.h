#pragma once

#include "cqa/core/taxonomy.h"

#include <optional>
#include <string>

namespace cqa::rules {

// Issue is one rule match. Immutable once created by the evaluator.
// line is 1-indexed; 0 marks a file-level issue.
struct Issue {
  core::Severity severity{core::Severity::kLow};
  core::Category category{core::Category::kStructure};
  std::string rule_id;
  std::string title;
  int line{0};
  std::string message;
  std::string evidence;
  std::optional<std::string> suggestion;
};

// Identifier of the synthetic issue produced when extraction fails.
inline constexpr const char* kUnparsableSourceRuleId = "SYS-001";

}  // namespace cqa::rules
