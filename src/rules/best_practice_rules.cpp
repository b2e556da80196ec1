#include "cqa/rules/builtin_rules.h"

#include "cqa/core/text.h"
#include "cqa/rules/rule_support.h"

#include <array>
#include <string>

namespace cqa::rules {

namespace {

using core::Category;
using core::Severity;

constexpr std::array<std::string_view, 5> kMutableDefaults{"[]", "{}", "list()", "dict()",
                                                           "set()"};

std::vector<RuleMatch> print_calls(const RuleContext& ctx) {
  std::vector<RuleMatch> matches;
  for (const auto& stmt : ctx.scanned.statements) {
    for (const std::size_t pos : support::find_builtin_calls(stmt.code, "print")) {
      matches.push_back(RuleMatch{support::line_at(stmt, pos),
                                  "Using print() instead of logging", "print(", {}});
    }
  }
  return matches;
}

std::vector<RuleMatch> long_lines(const RuleContext& ctx) {
  std::vector<RuleMatch> matches;
  const auto limit = static_cast<std::size_t>(ctx.thresholds.max_line_length);
  const auto& lines = ctx.unit.lines();
  for (std::size_t n = 0; n < lines.size(); ++n) {
    const std::size_t length = core::utf8_length(lines[n]);
    if (length > limit) {
      matches.push_back(RuleMatch{static_cast<int>(n + 1),
                                  "Line is " + std::to_string(length) + " characters (>" +
                                      std::to_string(limit) + ")",
                                  std::string{core::utf8_prefix(lines[n], 40)}, {}});
    }
  }
  return matches;
}

std::vector<RuleMatch> wildcard_imports(const RuleContext& ctx) {
  std::vector<RuleMatch> matches;
  for (const auto& stmt : ctx.scanned.statements) {
    if (support::header_keyword(stmt) != "from") {
      continue;
    }
    const std::size_t import_pos = core::find_word(stmt.code, "import");
    if (import_pos == std::string_view::npos) {
      continue;
    }
    const std::string_view names =
        core::trim_view(std::string_view(stmt.code).substr(import_pos + 6));
    if (names == "*") {
      matches.push_back(RuleMatch{stmt.first_line, "Wildcard import pollutes the namespace",
                                  core::trim(stmt.text), {}});
    }
  }
  return matches;
}

bool is_mutable_default(const std::string_view value) {
  const std::string_view text = core::trim_view(value);
  if (text.empty()) {
    return false;
  }
  for (const auto candidate : kMutableDefaults) {
    if (text == candidate) {
      return true;
    }
  }
  return text.front() == '[' || text.front() == '{';
}

std::vector<RuleMatch> mutable_defaults(const RuleContext& ctx) {
  std::vector<RuleMatch> matches;
  for (const auto& element : ctx.elements) {
    for (const auto& param : element.parameters) {
      if (is_mutable_default(param.default_value)) {
        matches.push_back(RuleMatch{element.start_line,
                                    "Parameter '" + param.name + "' of " +
                                        support::element_label(element) +
                                        " has a mutable default value",
                                    param.name + "=" + core::trim(param.default_value), {}});
      }
    }
  }
  return matches;
}

}  // namespace

std::vector<Rule> best_practice_rules() {
  return {
      Rule{"BP-001", "Print Statement", Category::kBestPractices, Severity::kLow,
           "print() used for diagnostics", "Use the logging module instead", print_calls},
      Rule{"BP-002", "Line Too Long", Category::kBestPractices, Severity::kLow,
           "Physical line longer than the configured limit",
           "Wrap the line or extract a local variable", long_lines},
      Rule{"BP-003", "Wildcard Import", Category::kBestPractices, Severity::kLow,
           "from module import * hides where names come from",
           "Import the names you use explicitly", wildcard_imports},
      Rule{"BP-004", "Mutable Default Argument", Category::kBestPractices, Severity::kMedium,
           "Mutable object shared between calls as a default value",
           "Default to None and create the object inside the function", mutable_defaults},
  };
}

}  // namespace cqa::rules
