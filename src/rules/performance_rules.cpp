#include "cqa/rules/builtin_rules.h"

#include "cqa/core/text.h"
#include "cqa/rules/rule_support.h"

#include <optional>
#include <string>

namespace cqa::rules {

namespace {

using core::Category;
using core::Severity;

// True for "name.append(...)" or "self.items.append(...)" spanning the whole statement.
bool is_append_call(const std::string_view code) {
  const std::string_view text = core::trim_view(code);
  const std::size_t pos = text.find(".append(");
  if (pos == std::string_view::npos || pos == 0 || !text.ends_with(")")) {
    return false;
  }
  for (const char ch : text.substr(0, pos)) {
    if (!core::is_ident_char(ch) && ch != '.') {
      return false;
    }
  }
  const std::string_view args = support::call_arguments(text, pos);
  return pos + std::string_view(".append(").size() + args.size() + 1 == text.size();
}

// Body of a single-statement block: the inline body, or the only child statement.
std::optional<std::string> sole_body(const source::ScannedSource& scanned, const std::size_t index,
                                     std::optional<std::size_t>* child_index) {
  const std::string body = support::inline_body(scanned.statements[index]);
  if (!body.empty()) {
    return body;
  }
  const auto children = support::direct_children(scanned, index);
  if (children.size() != 1) {
    return std::nullopt;
  }
  if (child_index != nullptr) {
    *child_index = children.front();
  }
  return scanned.statements[children.front()].code;
}

std::vector<RuleMatch> comprehension_candidates(const RuleContext& ctx) {
  std::vector<RuleMatch> matches;
  const auto& statements = ctx.scanned.statements;
  for (std::size_t i = 0; i < statements.size(); ++i) {
    if (support::header_keyword(statements[i]) != "for") {
      continue;
    }
    std::optional<std::size_t> child;
    const auto body = sole_body(ctx.scanned, i, &child);
    if (!body.has_value()) {
      continue;
    }
    bool candidate = is_append_call(*body);
    if (!candidate && child.has_value() && support::header_keyword(statements[*child]) == "if") {
      const auto filtered = sole_body(ctx.scanned, *child, nullptr);
      candidate = filtered.has_value() && is_append_call(*filtered);
    }
    if (candidate) {
      matches.push_back(RuleMatch{statements[i].first_line,
                                  "Loop only appends to a list; a comprehension is faster and clearer",
                                  core::trim(statements[i].text.substr(0, statements[i].text.find('\n'))),
                                  {}});
    }
  }
  return matches;
}

// Iterable expression of a for header ("for a, b in pairs.items():" -> "pairs.items()").
std::string loop_iterable(const source::LogicalLine& statement) {
  const std::string_view code = statement.code;
  const std::size_t in_pos = core::find_word(code, "in");
  if (in_pos == std::string_view::npos) {
    return {};
  }
  int depth = 0;
  for (std::size_t i = in_pos + 2; i < code.size(); ++i) {
    const char ch = code[i];
    if (ch == '(' || ch == '[' || ch == '{') {
      ++depth;
    } else if (ch == ')' || ch == ']' || ch == '}') {
      --depth;
    } else if (ch == ':' && depth == 0) {
      return core::trim(code.substr(in_pos + 2, i - in_pos - 2));
    }
  }
  return {};
}

// Walks from inner up to outer; false when a def/class lies between them.
bool same_function(const source::ScannedSource& scanned, const std::size_t inner,
                   const std::size_t outer) {
  auto current = scanned.statements[inner].parent;
  while (current.has_value() && *current != outer) {
    const std::string_view keyword = support::header_keyword(scanned.statements[*current]);
    if (keyword == "def" || keyword == "class") {
      return false;
    }
    current = scanned.statements[*current].parent;
  }
  return current.has_value();
}

std::vector<RuleMatch> quadratic_loops(const RuleContext& ctx) {
  std::vector<RuleMatch> matches;
  const auto& statements = ctx.scanned.statements;
  std::vector<bool> reported(statements.size(), false);
  for (std::size_t i = 0; i < statements.size(); ++i) {
    if (support::header_keyword(statements[i]) != "for") {
      continue;
    }
    const std::string outer = loop_iterable(statements[i]);
    if (outer.empty()) {
      continue;
    }
    const std::size_t end = support::subtree_end(ctx.scanned, i);
    for (std::size_t j = i + 1; j < end; ++j) {
      if (reported[j] || support::header_keyword(statements[j]) != "for" ||
          loop_iterable(statements[j]) != outer || !same_function(ctx.scanned, j, i)) {
        continue;
      }
      reported[j] = true;
      matches.push_back(RuleMatch{statements[j].first_line,
                                  "Nested loop iterates '" + outer +
                                      "' again inside a loop over the same collection (O(n^2))",
                                  outer,
                                  {}});
    }
  }
  return matches;
}

// Position of a top-level "+=" operator, or npos.
std::size_t find_augmented_add(const std::string_view code) {
  int depth = 0;
  for (std::size_t i = 0; i + 1 < code.size(); ++i) {
    const char ch = code[i];
    if (ch == '(' || ch == '[' || ch == '{') {
      ++depth;
    } else if (ch == ')' || ch == ']' || ch == '}') {
      --depth;
    } else if (depth == 0 && ch == '+' && code[i + 1] == '=') {
      return i;
    }
  }
  return std::string_view::npos;
}

std::vector<RuleMatch> string_concatenation_in_loops(const RuleContext& ctx) {
  std::vector<RuleMatch> matches;
  const auto& statements = ctx.scanned.statements;
  for (std::size_t i = 0; i < statements.size(); ++i) {
    const std::string_view code = statements[i].code;
    const std::size_t op = find_augmented_add(code);
    if (op == std::string_view::npos) {
      continue;
    }
    // Quotes survive masking, so a quote on the right-hand side marks a string literal.
    const std::string_view rhs = code.substr(op + 2);
    if (rhs.find_first_of("\"'") == std::string_view::npos) {
      continue;
    }
    if (!support::enclosed_by(ctx.scanned, i, {"for", "while"})) {
      continue;
    }
    const std::string target = core::trim(code.substr(0, op));
    matches.push_back(RuleMatch{statements[i].first_line,
                                "String '" + target + "' is built with += inside a loop",
                                target, {}});
  }
  return matches;
}

}  // namespace

std::vector<Rule> performance_rules() {
  return {
      Rule{"PRF-001", "Comprehension Opportunity", Category::kPerformance, Severity::kLow,
           "Loop whose only effect is appending to a list",
           "Replace the loop with a list comprehension", comprehension_candidates},
      Rule{"PRF-002", "Quadratic Nested Loop", Category::kPerformance, Severity::kMedium,
           "Nested loops over the same collection",
           "Index the collection in a dict or set before the outer loop", quadratic_loops},
      Rule{"PRF-003", "String Concatenation In Loop", Category::kPerformance, Severity::kLow,
           "String grown with += on every iteration",
           "Collect the parts in a list and join them once after the loop",
           string_concatenation_in_loops},
  };
}

}  // namespace cqa::rules
