#include "cqa/rules/builtin_rules.h"

#include "cqa/core/text.h"
#include "cqa/rules/rule_support.h"

#include <array>
#include <optional>
#include <string>

namespace cqa::rules {

namespace {

using core::Category;
using core::Severity;

constexpr std::array<std::string_view, 2> kBuiltinIoCalls{"open", "urlopen"};

constexpr std::array<std::string_view, 16> kDottedIoCalls{
    "requests.get",        "requests.post",       "requests.put",
    "requests.delete",     "requests.patch",      "requests.head",
    "requests.request",    "urllib.request.urlopen", "socket.create_connection",
    "shutil.copy",         "shutil.copyfile",     "shutil.move",
    "shutil.rmtree",       "os.remove",           "os.unlink",
    "os.rename",
};

constexpr std::array<std::string_view, 7> kDottedAcquisitions{
    "socket.socket",         "sqlite3.connect",  "zipfile.ZipFile",          "tarfile.open",
    "tempfile.TemporaryFile", "tempfile.NamedTemporaryFile", "urllib.request.urlopen",
};

// Text following the "except" keyword of a handler header.
std::string_view handler_clause(const source::LogicalLine& statement) {
  std::string_view code = core::trim_view(statement.code);
  code.remove_prefix(std::string_view("except").size());
  return core::trim_view(code);
}

std::vector<RuleMatch> catch_all_handlers(const RuleContext& ctx) {
  std::vector<RuleMatch> matches;
  for (const auto& stmt : ctx.scanned.statements) {
    if (support::header_keyword(stmt) != "except") {
      continue;
    }
    const std::string_view clause = handler_clause(stmt);
    if (clause.starts_with(":")) {
      matches.push_back(RuleMatch{
          stmt.first_line,
          "Using bare except: catches all exceptions including system exits", "except:", {}});
    } else if (core::leading_identifier(clause) == "BaseException") {
      matches.push_back(RuleMatch{
          stmt.first_line,
          "Catching BaseException also traps KeyboardInterrupt and SystemExit",
          "except BaseException", {}});
    }
  }
  return matches;
}

bool is_noop(const std::string_view code) {
  const std::string_view text = core::trim_view(code);
  return text == "pass" || text == "...";
}

std::vector<RuleMatch> swallowed_exceptions(const RuleContext& ctx) {
  std::vector<RuleMatch> matches;
  const auto& statements = ctx.scanned.statements;
  for (std::size_t i = 0; i < statements.size(); ++i) {
    if (support::header_keyword(statements[i]) != "except") {
      continue;
    }
    const std::string body = support::inline_body(statements[i]);
    bool swallowed = false;
    if (!body.empty()) {
      swallowed = is_noop(body);
    } else {
      const auto children = support::direct_children(ctx.scanned, i);
      swallowed = children.size() == 1 && is_noop(statements[children.front()].code);
    }
    if (swallowed) {
      matches.push_back(RuleMatch{statements[i].first_line,
                                  "Exception handler silently discards the error",
                                  core::trim(statements[i].code), {}});
    }
  }
  return matches;
}

// Name of the first I/O-like call in the statement, if any.
std::optional<std::string_view> first_io_call(const std::string_view code) {
  for (const auto name : kBuiltinIoCalls) {
    if (!support::find_builtin_calls(code, name).empty()) {
      return name;
    }
  }
  for (const auto name : kDottedIoCalls) {
    if (!support::find_dotted_calls(code, name).empty()) {
      return name;
    }
  }
  return std::nullopt;
}

std::vector<RuleMatch> unguarded_io(const RuleContext& ctx) {
  std::vector<RuleMatch> matches;
  const auto& statements = ctx.scanned.statements;
  for (std::size_t i = 0; i < statements.size(); ++i) {
    const std::string_view keyword = support::header_keyword(statements[i]);
    if (keyword == "def" || keyword == "class") {
      continue;
    }
    const auto call = first_io_call(statements[i].code);
    // "try: data = open(p).read()" guards its own inline body.
    if (!call.has_value() || keyword == "try" || support::enclosed_by(ctx.scanned, i, {"try"})) {
      continue;
    }
    matches.push_back(RuleMatch{statements[i].first_line,
                                "I/O call " + std::string(*call) +
                                    "() is not protected by any try/except block",
                                std::string(*call), {}});
  }
  return matches;
}

// Position of the assignment '=' at bracket depth zero, skipping comparison and
// augmented operators.
std::size_t find_assignment(const std::string_view code) {
  int depth = 0;
  for (std::size_t i = 0; i < code.size(); ++i) {
    const char ch = code[i];
    if (ch == '(' || ch == '[' || ch == '{') {
      ++depth;
    } else if (ch == ')' || ch == ']' || ch == '}') {
      --depth;
    } else if (ch == '=' && depth == 0) {
      const char prev = i > 0 ? code[i - 1] : ' ';
      const char next = i + 1 < code.size() ? code[i + 1] : ' ';
      if (next == '=' || std::string_view("=!<>+-*/%&|^:@").find(prev) != std::string_view::npos) {
        ++i;
        continue;
      }
      return i;
    }
  }
  return std::string_view::npos;
}

bool starts_with_call(const std::string_view rhs, const std::string_view name) {
  if (!rhs.starts_with(name)) {
    return false;
  }
  const std::string_view rest = core::trim_view(rhs.substr(name.size()));
  return rest.starts_with("(");
}

// Variable bound to a freshly acquired resource by a plain assignment, if any.
std::optional<std::string> acquired_resource(const source::LogicalLine& statement) {
  const std::string_view code = statement.code;
  const std::size_t equals = find_assignment(code);
  if (equals == std::string_view::npos) {
    return std::nullopt;
  }
  const std::string_view target = core::trim_view(code.substr(0, equals));
  if (target.empty() || core::leading_identifier(target) != target) {
    return std::nullopt;  // Attribute, subscript and tuple targets are owned elsewhere.
  }
  const std::string_view rhs = core::trim_view(code.substr(equals + 1));
  bool acquires = starts_with_call(rhs, "open");
  for (const auto name : kDottedAcquisitions) {
    acquires = acquires || starts_with_call(rhs, name);
  }
  if (!acquires) {
    return std::nullopt;
  }
  return std::string{target};
}

// True when a later statement in [begin, end) releases or hands off the resource.
bool resource_released(const RuleContext& ctx, const std::string& name, const std::size_t begin,
                       const std::size_t end) {
  const auto& statements = ctx.scanned.statements;
  const std::string close_call = name + ".close(";
  for (std::size_t j = begin; j < end; ++j) {
    const auto& stmt = statements[j];
    const std::string_view keyword = support::header_keyword(stmt);
    if ((keyword == "return" || keyword == "yield") &&
        core::find_word(stmt.code, name) != std::string_view::npos) {
      return true;  // Ownership passes to the caller.
    }
    if (keyword == "with" && core::find_word(stmt.code, name) != std::string_view::npos) {
      return true;
    }
    if (keyword != "finally") {
      continue;
    }
    if (support::inline_body(stmt).find(close_call) != std::string::npos) {
      return true;
    }
    const std::size_t finally_end = support::subtree_end(ctx.scanned, j);
    for (std::size_t k = j + 1; k < finally_end; ++k) {
      if (statements[k].code.find(close_call) != std::string::npos) {
        return true;
      }
    }
  }
  return false;
}

std::vector<RuleMatch> missing_cleanup(const RuleContext& ctx) {
  std::vector<RuleMatch> matches;
  const auto& statements = ctx.scanned.statements;
  for (std::size_t i = 0; i < statements.size(); ++i) {
    if (support::header_keyword(statements[i]) == "with") {
      continue;
    }
    const auto resource = acquired_resource(statements[i]);
    if (!resource.has_value()) {
      continue;
    }

    // Search the rest of the enclosing function, or the rest of the module.
    std::size_t scope_end = statements.size();
    auto parent = statements[i].parent;
    while (parent.has_value()) {
      const std::string_view keyword = support::header_keyword(statements[*parent]);
      if (keyword == "def") {
        scope_end = support::subtree_end(ctx.scanned, *parent);
        break;
      }
      parent = statements[*parent].parent;
    }

    if (!resource_released(ctx, *resource, i + 1, scope_end)) {
      matches.push_back(RuleMatch{statements[i].first_line,
                                  "Resource '" + *resource +
                                      "' is acquired without a with-block or finally cleanup",
                                  *resource, {}});
    }
  }
  return matches;
}

}  // namespace

std::vector<Rule> error_handling_rules() {
  return {
      Rule{"ERR-001", "Bare Except Clause", Category::kErrorHandling, Severity::kHigh,
           "Handler catches every exception, including interpreter exits",
           "Catch the specific exception types the block can raise", catch_all_handlers},
      Rule{"ERR-002", "Swallowed Exception", Category::kErrorHandling, Severity::kMedium,
           "Handler body does nothing with the caught exception",
           "Log the exception or re-raise it with context", swallowed_exceptions},
      Rule{"ERR-003", "Unguarded I/O", Category::kErrorHandling, Severity::kMedium,
           "File, network or filesystem call without surrounding error handling",
           "Wrap the call in try/except and handle the failure explicitly", unguarded_io},
      Rule{"ERR-004", "Missing Resource Cleanup", Category::kErrorHandling, Severity::kMedium,
           "Resource acquired without a guaranteed release",
           "Acquire the resource in a with-statement", missing_cleanup},
  };
}

}  // namespace cqa::rules
