#include "cqa/rules/builtin_rules.h"

#include "cqa/core/text.h"
#include "cqa/rules/rule_support.h"

#include <string>

namespace cqa::rules {

namespace {

using core::Category;
using core::Severity;
using extract::ElementKind;
using extract::StructuralElement;

bool is_private(const std::string_view name) {
  return name.starts_with("_") && !core::is_dunder(name);
}

std::vector<RuleMatch> missing_docstrings(const RuleContext& ctx, const bool private_names) {
  std::vector<RuleMatch> matches;
  if (!ctx.thresholds.require_docstrings) {
    return matches;
  }
  for (const auto& element : ctx.elements) {
    if (element.has_docstring || core::is_dunder(element.name) ||
        is_private(element.name) != private_names) {
      continue;
    }
    matches.push_back(RuleMatch{element.start_line,
                                support::element_label(element) + " has no docstring",
                                element.name, {}});
  }
  return matches;
}

std::vector<RuleMatch> missing_public_docstrings(const RuleContext& ctx) {
  return missing_docstrings(ctx, false);
}

std::vector<RuleMatch> missing_private_docstrings(const RuleContext& ctx) {
  return missing_docstrings(ctx, true);
}

bool is_receiver(const std::string_view name) { return name == "self" || name == "cls"; }

// "def __repr__(self):" has nothing to annotate except the return type.
bool exempt_from_hints(const StructuralElement& element) {
  if (!core::is_dunder(element.name)) {
    return false;
  }
  for (const auto& param : element.parameters) {
    if (!is_receiver(param.name)) {
      return false;
    }
  }
  return true;
}

std::vector<RuleMatch> missing_type_hints(const RuleContext& ctx) {
  std::vector<RuleMatch> matches;
  if (!ctx.thresholds.require_type_hints) {
    return matches;
  }
  for (const auto& element : ctx.elements) {
    if (element.kind != ElementKind::kFunction || element.has_type_hints ||
        exempt_from_hints(element)) {
      continue;
    }
    matches.push_back(RuleMatch{element.start_line,
                                support::element_label(element) +
                                    " has no parameter or return annotations",
                                element.name, {}});
  }
  return matches;
}

std::vector<RuleMatch> naming_violations(const RuleContext& ctx) {
  std::vector<RuleMatch> matches;
  for (const auto& element : ctx.elements) {
    if (element.kind == ElementKind::kFunction) {
      if (core::is_dunder(element.name) || core::is_snake_case(element.name)) {
        continue;
      }
      matches.push_back(RuleMatch{element.start_line,
                                  "Function name '" + element.name + "' is not snake_case",
                                  element.name, std::string("Rename the function using snake_case")});
    } else if (!core::is_cap_words(element.name)) {
      matches.push_back(RuleMatch{element.start_line,
                                  "Class name '" + element.name + "' is not CapWords",
                                  element.name, std::string("Rename the class using CapWords")});
    }
  }
  return matches;
}

}  // namespace

std::vector<Rule> maintainability_rules() {
  return {
      Rule{"MNT-001", "Missing Docstring", Category::kMaintainability, Severity::kMedium,
           "Public function or class without a docstring",
           "Document what the function does, its arguments and its return value",
           missing_public_docstrings},
      Rule{"MNT-002", "Missing Docstring", Category::kMaintainability, Severity::kLow,
           "Private function or class without a docstring",
           "Add a one-line docstring describing the helper", missing_private_docstrings},
      Rule{"MNT-003", "Missing Type Hints", Category::kMaintainability, Severity::kLow,
           "Function signature without any type annotation",
           "Annotate parameters and the return type", missing_type_hints},
      Rule{"MNT-004", "Naming Convention", Category::kMaintainability, Severity::kLow,
           "Name does not follow PEP 8 conventions",
           "Use snake_case for functions and CapWords for classes", naming_violations},
  };
}

}  // namespace cqa::rules
