#include "cqa/engine/rule_evaluator.h"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <utility>

namespace cqa::engine {

namespace {

// Issue plus the registration index of the rule that produced it (tertiary sort key).
struct RankedIssue {
  rules::Issue issue;
  std::size_t rule_index{0};
};

rules::Issue make_issue(const rules::Rule& rule, rules::RuleMatch match) {
  rules::Issue issue{};
  issue.severity = rule.severity;
  issue.category = rule.category;
  issue.rule_id = rule.rule_id;
  issue.title = rule.title;
  issue.line = match.line;
  issue.message = std::move(match.message);
  issue.evidence = std::move(match.evidence);
  if (match.suggestion.has_value()) {
    issue.suggestion = std::move(match.suggestion);
  } else if (!rule.suggestion.empty()) {
    issue.suggestion = rule.suggestion;
  }
  return issue;
}

rules::Issue make_internal_error(const rules::Rule& rule, const std::string& what) {
  rules::Issue issue{};
  issue.severity = core::Severity::kLow;
  issue.category = rule.category;
  issue.rule_id = rule.rule_id;
  issue.title = "Rule Internal Error";
  issue.line = 0;
  issue.message = "Rule " + rule.rule_id + " failed: " + what;
  return issue;
}

}  // namespace

std::vector<rules::Issue> evaluate_rules(const rules::RuleCatalog& catalog,
                                         const rules::RuleContext& context) {
  std::vector<RankedIssue> ranked;

  // Rules run in registration order; a failing rule never stops the others
  const auto& all_rules = catalog.rules();
  for (std::size_t index = 0; index < all_rules.size(); ++index) {
    const auto& rule = all_rules[index];
    std::vector<rules::RuleMatch> matches;
    try {
      matches = rule.evaluate(context);
    } catch (const std::exception& e) {
      ranked.push_back(RankedIssue{make_internal_error(rule, e.what()), index});
      continue;
    } catch (...) {
      ranked.push_back(RankedIssue{make_internal_error(rule, "unknown exception"), index});
      continue;
    }
    for (auto& match : matches) {
      ranked.push_back(RankedIssue{make_issue(rule, std::move(match)), index});
    }
  }

  // Stable: equal keys keep emission order
  std::stable_sort(ranked.begin(), ranked.end(), [](const RankedIssue& a, const RankedIssue& b) {
    if (a.issue.severity != b.issue.severity) {
      return a.issue.severity > b.issue.severity;
    }
    if (a.issue.line != b.issue.line) {
      return a.issue.line < b.issue.line;
    }
    return a.rule_index < b.rule_index;
  });

  std::vector<rules::Issue> issues;
  issues.reserve(ranked.size());
  for (auto& entry : ranked) {
    issues.push_back(std::move(entry.issue));
  }
  return issues;
}

rules::Issue make_unparsable_issue(const source::ScanError& failure) {
  rules::Issue issue{};
  issue.severity = core::Severity::kCritical;
  issue.category = core::Category::kStructure;
  issue.rule_id = rules::kUnparsableSourceRuleId;
  issue.title = "Unparsable Source";
  issue.line = failure.line;
  issue.message = "Source could not be decomposed: " + failure.reason;
  issue.suggestion = "Fix the syntax error before re-running the analysis";
  return issue;
}

}  // namespace cqa::engine
