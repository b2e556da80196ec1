#include "cqa/rules/builtin_rules.h"

#include "cqa/core/text.h"
#include "cqa/extract/extractor.h"
#include "cqa/rules/rule_support.h"

#include <map>
#include <string>

namespace cqa::rules {

namespace {

using core::Category;
using core::Severity;
using extract::ElementKind;

// Lines shorter than this never count as duplicated code.
constexpr std::size_t kDuplicateMinLength = 20;
// A line must appear more than this many times to count as duplicated.
constexpr int kDuplicateMaxOccurrences = 2;

std::vector<RuleMatch> long_functions(const RuleContext& ctx) {
  std::vector<RuleMatch> matches;
  for (const auto& element : ctx.elements) {
    if (element.kind != ElementKind::kFunction) {
      continue;
    }
    const int length = element.length();
    if (length > ctx.thresholds.max_function_length) {
      matches.push_back(RuleMatch{element.start_line,
                                  support::element_label(element) + " is " +
                                      std::to_string(length) + " lines (>" +
                                      std::to_string(ctx.thresholds.max_function_length) + ")",
                                  element.name,
                                  {}});
    }
  }
  return matches;
}

std::vector<RuleMatch> warn_length_functions(const RuleContext& ctx) {
  std::vector<RuleMatch> matches;
  for (const auto& element : ctx.elements) {
    if (element.kind != ElementKind::kFunction) {
      continue;
    }
    const int length = element.length();
    if (length > ctx.thresholds.warn_function_length &&
        length <= ctx.thresholds.max_function_length) {
      matches.push_back(RuleMatch{element.start_line,
                                  support::element_label(element) + " is " +
                                      std::to_string(length) + " lines (>" +
                                      std::to_string(ctx.thresholds.warn_function_length) + ")",
                                  element.name,
                                  {}});
    }
  }
  return matches;
}

std::vector<RuleMatch> deep_nesting(const RuleContext& ctx) {
  std::vector<RuleMatch> matches;
  for (const auto& element : ctx.elements) {
    if (element.kind == ElementKind::kFunction &&
        element.block_depth > ctx.thresholds.max_nesting_depth) {
      matches.push_back(RuleMatch{element.start_line,
                                  support::element_label(element) + " nests blocks " +
                                      std::to_string(element.block_depth) + " levels deep (>" +
                                      std::to_string(ctx.thresholds.max_nesting_depth) + ")",
                                  element.name,
                                  {}});
    }
  }
  return matches;
}

std::vector<RuleMatch> large_classes(const RuleContext& ctx) {
  std::vector<RuleMatch> matches;
  for (std::size_t i = 0; i < ctx.elements.size(); ++i) {
    const auto& element = ctx.elements[i];
    if (element.kind != ElementKind::kClass) {
      continue;
    }
    int methods = 0;
    for (const std::size_t child : extract::child_elements(ctx.elements, i)) {
      if (ctx.elements[child].kind == ElementKind::kFunction) {
        ++methods;
      }
    }
    if (methods > ctx.thresholds.max_class_methods) {
      matches.push_back(RuleMatch{element.start_line,
                                  support::element_label(element) + " defines " +
                                      std::to_string(methods) + " methods (>" +
                                      std::to_string(ctx.thresholds.max_class_methods) + ")",
                                  element.name,
                                  {}});
    }
  }
  return matches;
}

std::vector<RuleMatch> complex_functions(const RuleContext& ctx) {
  std::vector<RuleMatch> matches;
  for (const auto& element : ctx.elements) {
    if (element.kind == ElementKind::kFunction &&
        element.complexity > ctx.thresholds.max_complexity) {
      matches.push_back(RuleMatch{element.start_line,
                                  support::element_label(element) +
                                      " has cyclomatic complexity " +
                                      std::to_string(element.complexity) + " (>" +
                                      std::to_string(ctx.thresholds.max_complexity) + ")",
                                  element.name,
                                  {}});
    }
  }
  return matches;
}

// Reported once per file, at the first line of the earliest repeated text.
std::vector<RuleMatch> duplicated_lines(const RuleContext& ctx) {
  std::map<std::string_view, int> counts;
  std::map<std::string_view, int> first_seen;
  const auto& lines = ctx.unit.lines();
  for (std::size_t n = 0; n < lines.size(); ++n) {
    const std::string_view stripped = core::trim_view(lines[n]);
    if (stripped.size() <= kDuplicateMinLength || stripped.front() == '#') {
      continue;
    }
    if (++counts[stripped] == 1) {
      first_seen[stripped] = static_cast<int>(n + 1);
    }
  }

  int first_line = 0;
  std::string_view repeated;
  int occurrences = 0;
  for (const auto& [text, count] : counts) {
    if (count <= kDuplicateMaxOccurrences) {
      continue;
    }
    const int line = first_seen[text];
    if (first_line == 0 || line < first_line) {
      first_line = line;
      repeated = text;
      occurrences = count;
    }
  }

  if (first_line == 0) {
    return {};
  }
  return {RuleMatch{first_line,
                    "Line repeated " + std::to_string(occurrences) +
                        " times; potential code duplication",
                    std::string{repeated},
                    {}}};
}

}  // namespace

std::vector<Rule> structure_rules() {
  return {
      Rule{"STR-001", "Long Function", Category::kStructure, Severity::kHigh,
           "Function body exceeds the maximum function length",
           "Split the function into smaller, single-purpose helpers", long_functions},
      Rule{"STR-002", "Long Function", Category::kStructure, Severity::kMedium,
           "Function body exceeds the warning function length",
           "Consider extracting cohesive blocks into helpers", warn_length_functions},
      Rule{"STR-003", "Deep Nesting", Category::kStructure, Severity::kMedium,
           "Control flow nested deeper than the configured limit",
           "Use guard clauses or extract nested blocks", deep_nesting},
      Rule{"STR-004", "Large Class", Category::kStructure, Severity::kMedium,
           "Class defines more methods than the configured limit",
           "Split unrelated responsibilities into separate classes", large_classes},
      Rule{"STR-005", "High Complexity", Category::kStructure, Severity::kMedium,
           "Function has too many decision points",
           "Reduce branching by extracting decisions into helpers", complex_functions},
      Rule{"STR-006", "Code Duplication", Category::kStructure, Severity::kMedium,
           "Identical non-trivial lines repeated across the file",
           "Extract the repeated logic into a shared function", duplicated_lines},
  };
}

}  // namespace cqa::rules
