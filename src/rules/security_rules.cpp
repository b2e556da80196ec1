#include "cqa/rules/builtin_rules.h"

#include "cqa/core/text.h"
#include "cqa/rules/rule_support.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <optional>
#include <regex>
#include <string>

namespace cqa::rules {

namespace {

using core::Category;
using core::Severity;

constexpr std::array<std::string_view, 11> kSecretNames{
    "password", "passwd", "pwd",   "secret",      "api_key",      "apikey",
    "access_key", "auth_token", "token", "private_key", "client_secret",
};

constexpr std::array<std::string_view, 9> kPlaceholderValues{
    "changeme", "change_me", "placeholder", "example", "dummy",
    "none",     "null",      "todo",        "redacted",
};

// Literals at least this long are checked for random-looking content.
constexpr std::size_t kEntropyMinLength = 32;
constexpr double kEntropyThreshold = 4.5;

constexpr std::array<std::string_view, 4> kDynamicExecutionBuiltins{"eval", "exec", "compile",
                                                                    "__import__"};

constexpr std::array<std::string_view, 2> kBuiltinPathCalls{"open", "Path"};

constexpr std::array<std::string_view, 11> kDottedPathCalls{
    "os.remove",    "os.unlink",     "os.rmdir",     "os.makedirs",
    "os.mkdir",     "os.listdir",    "shutil.rmtree", "shutil.copy",
    "shutil.copyfile", "shutil.move", "pathlib.Path",
};

const std::regex& assignment_pattern() {
  // Optional annotation: "password: str = ...".
  static const std::regex pattern(
      R"(([A-Za-z_][A-Za-z0-9_]*)\s*(:[^=:]+)?=\s*[rRbBuU]?(["'])([^"']*)\3)");
  return pattern;
}

const std::regex& dict_entry_pattern() {
  static const std::regex pattern(R"((["'])([A-Za-z_][A-Za-z0-9_]*)\1\s*:\s*[rRbBuU]?(["'])([^"']*)\3)");
  return pattern;
}

const std::regex& key_shape_pattern() {
  static const std::regex pattern(
      R"(AKIA[0-9A-Z]{16}|-----BEGIN ([A-Z]+ )?PRIVATE KEY-----|ghp_[A-Za-z0-9]{36}|sk-[A-Za-z0-9]{32,})");
  return pattern;
}

const std::regex& shell_true_pattern() {
  static const std::regex pattern(R"(\bshell\s*=\s*True\b)");
  return pattern;
}

// "db_password" and "API_KEY" carry a secret name as a whole '_'-separated component.
bool is_secret_name(const std::string_view name) {
  const std::string padded = "_" + core::normalize_ascii_lower(name) + "_";
  for (const auto secret : kSecretNames) {
    if (padded.find("_" + std::string(secret) + "_") != std::string::npos) {
      return true;
    }
  }
  return false;
}

bool is_placeholder(const std::string_view value) {
  const std::string lowered = core::normalize_ascii_lower(core::trim_view(value));
  if (lowered.empty()) {
    return true;
  }
  if ((lowered.front() == '<' && lowered.back() == '>') || lowered.starts_with("${") ||
      lowered.starts_with("{{") || lowered.starts_with("your_") || lowered.starts_with("your-")) {
    return true;
  }
  if (lowered.find_first_not_of("x*.-") == std::string::npos) {
    return true;  // "xxxx", "****", "..."
  }
  for (const auto placeholder : kPlaceholderValues) {
    if (lowered == placeholder) {
      return true;
    }
  }
  return false;
}

// An annotated name starts a statement ("password: str"), follows a receiver
// ("self.password: str") or is a parameter ("def login(password: str = ...)").
bool is_annotation_target(const std::string& raw, const std::size_t name_pos) {
  const std::string_view prefix = core::trim_view(std::string_view(raw).substr(0, name_pos));
  return prefix.empty() || prefix.back() == '.' || prefix.back() == '(' || prefix.back() == ',';
}

// Characters at pos are real code (not masked string content or comment).
bool is_code_at(const source::LineFacts& facts, const std::string& raw, const std::size_t pos) {
  return pos < facts.code.size() && facts.code[pos] == raw[pos];
}

std::optional<std::string> named_secret(const source::LineFacts& facts, const std::string& raw) {
  std::size_t from = 0;
  std::smatch match;
  while (from < raw.size() &&
         std::regex_search(raw.cbegin() + static_cast<std::ptrdiff_t>(from), raw.cend(), match,
                           assignment_pattern(),
                           from == 0 ? std::regex_constants::match_default
                                     : std::regex_constants::match_prev_avail)) {
    const std::size_t name_pos = from + static_cast<std::size_t>(match.position(1));
    if (match[2].matched && !is_annotation_target(raw, name_pos)) {
      // "if ok: password = ..." is a header; rescan after the name.
      from = name_pos + static_cast<std::size_t>(match.length(1));
      continue;
    }
    if (is_code_at(facts, raw, name_pos) && is_secret_name(match.str(1)) &&
        !is_placeholder(match.str(4))) {
      return match.str(1);
    }
    from += static_cast<std::size_t>(match.position(0) + match.length(0));
  }
  for (auto it = std::sregex_iterator(raw.begin(), raw.end(), dict_entry_pattern());
       it != std::sregex_iterator(); ++it) {
    const auto& match = *it;
    const auto quote_pos = static_cast<std::size_t>(match.position(0));
    if (is_code_at(facts, raw, quote_pos) && is_secret_name(match.str(2)) &&
        !is_placeholder(match.str(4))) {
      return match.str(2);
    }
  }
  return std::nullopt;
}

// Contents of the string literals that open on this line. A literal left open runs to the
// end of the line.
std::vector<std::string> line_literals(const source::LineFacts& facts, const std::string& raw) {
  std::vector<std::string> literals;
  const std::string& code = facts.code;
  std::size_t i = 0;
  while (i < code.size()) {
    const char quote = code[i];
    if (quote != '"' && quote != '\'') {
      ++i;
      continue;
    }
    const bool triple = code.compare(i, 3, std::string(3, quote)) == 0;
    const std::size_t delimiter = triple ? 3 : 1;
    const std::size_t close = code.find(std::string(delimiter, quote), i + delimiter);
    if (close == std::string::npos) {
      literals.push_back(raw.substr(std::min(i + delimiter, raw.size())));
      break;
    }
    literals.push_back(raw.substr(i + delimiter, close - i - delimiter));
    i = close + delimiter;
  }
  return literals;
}

// Key material inside string literals only; comments never count.
std::optional<std::string> credential_shape(const std::vector<std::string>& literals) {
  for (const auto& literal : literals) {
    std::smatch shape;
    if (std::regex_search(literal, shape, key_shape_pattern())) {
      return shape.str(0);
    }
  }
  return std::nullopt;
}

bool is_random_looking(const std::string_view literal) {
  return literal.size() >= kEntropyMinLength &&
         literal.find_first_of(" \t") == std::string_view::npos &&
         core::shannon_entropy(literal) >= kEntropyThreshold;
}

std::vector<RuleMatch> hardcoded_secrets(const RuleContext& ctx) {
  std::vector<RuleMatch> matches;
  const auto& lines = ctx.unit.lines();
  for (std::size_t n = 0; n < lines.size() && n < ctx.scanned.lines.size(); ++n) {
    const auto& facts = ctx.scanned.lines[n];
    if (facts.comment_only || facts.starts_in_string) {
      continue;
    }
    const std::string& raw = lines[n];
    const int line = static_cast<int>(n + 1);

    if (const auto name = named_secret(facts, raw)) {
      matches.push_back(RuleMatch{line, "Potential hardcoded secret assigned to '" + *name + "'",
                                  *name, {}});
      continue;
    }
    const std::vector<std::string> literals = line_literals(facts, raw);
    if (const auto shape = credential_shape(literals)) {
      matches.push_back(RuleMatch{line, "Literal matches the shape of a credential",
                                  shape->substr(0, 8) + "...", {}});
      continue;
    }
    for (const auto& literal : literals) {
      if (is_random_looking(literal)) {
        matches.push_back(RuleMatch{line, "High-entropy literal looks like an embedded credential",
                                    literal.substr(0, 8) + "...", {}});
        break;
      }
    }
  }
  return matches;
}

std::vector<RuleMatch> dynamic_execution(const RuleContext& ctx) {
  std::vector<RuleMatch> matches;
  for (const auto& stmt : ctx.scanned.statements) {
    for (const auto name : kDynamicExecutionBuiltins) {
      for (const std::size_t pos : support::find_builtin_calls(stmt.code, name)) {
        matches.push_back(RuleMatch{support::line_at(stmt, pos),
                                    "Use of " + std::string(name) + "() executes dynamic code",
                                    std::string(name), {}});
      }
    }
  }
  return matches;
}

// Raw text of the arguments of the call at pos (code and text share offsets).
std::string_view raw_arguments(const source::LogicalLine& stmt, const std::size_t pos,
                               std::string_view* masked) {
  const std::string_view code = stmt.code;
  const std::string_view args = support::call_arguments(code, pos);
  *masked = args;
  const auto offset = static_cast<std::size_t>(args.data() - code.data());
  return std::string_view(stmt.text).substr(offset, args.size());
}

bool has_path_interpolation(const std::string_view masked, const std::string_view raw) {
  if (masked.find('+') != std::string_view::npos) {
    return true;
  }
  const bool f_string = masked.find("f\"") != std::string_view::npos ||
                        masked.find("f'") != std::string_view::npos ||
                        masked.find("F\"") != std::string_view::npos ||
                        masked.find("F'") != std::string_view::npos;
  return f_string && raw.find('/') != std::string_view::npos &&
         raw.find('{') != std::string_view::npos;
}

std::vector<RuleMatch> path_concatenation(const RuleContext& ctx) {
  std::vector<RuleMatch> matches;
  for (const auto& stmt : ctx.scanned.statements) {
    const auto check = [&](const std::string_view name, const std::size_t pos) {
      std::string_view masked;
      const std::string_view raw = raw_arguments(stmt, pos, &masked);
      if (has_path_interpolation(masked, raw)) {
        matches.push_back(RuleMatch{support::line_at(stmt, pos),
                                    "Path passed to " + std::string(name) +
                                        "() is built from unchecked string pieces",
                                    std::string(name), {}});
      }
    };
    for (const auto name : kBuiltinPathCalls) {
      for (const std::size_t pos : support::find_builtin_calls(stmt.code, name)) {
        check(name, pos);
      }
    }
    for (const auto name : kDottedPathCalls) {
      for (const std::size_t pos : support::find_dotted_calls(stmt.code, name)) {
        check(name, pos);
      }
    }
  }
  return matches;
}

std::vector<RuleMatch> shell_execution(const RuleContext& ctx) {
  std::vector<RuleMatch> matches;
  for (const auto& stmt : ctx.scanned.statements) {
    for (const std::string_view name : {"os.system", "os.popen"}) {
      for (const std::size_t pos : support::find_dotted_calls(stmt.code, name)) {
        matches.push_back(RuleMatch{support::line_at(stmt, pos),
                                    std::string(name) + "() runs its argument through a shell",
                                    std::string(name), {}});
      }
    }
    std::smatch shell;
    if (std::regex_search(stmt.code, shell, shell_true_pattern())) {
      matches.push_back(RuleMatch{support::line_at(stmt, static_cast<std::size_t>(shell.position(0))),
                                  "Subprocess call with shell=True", "shell=True", {}});
    }
  }
  return matches;
}

}  // namespace

std::vector<Rule> security_rules() {
  return {
      Rule{"SEC-001", "Hardcoded Secret", Category::kSecurity, Severity::kCritical,
           "Credential or key material embedded in source",
           "Load secrets from the environment or a secret manager", hardcoded_secrets},
      Rule{"SEC-002", "Dynamic Code Execution", Category::kSecurity, Severity::kHigh,
           "eval/exec/compile/__import__ on runtime data",
           "Use ast.literal_eval or an explicit dispatch table", dynamic_execution},
      Rule{"SEC-003", "Unsanitized Path Concatenation", Category::kSecurity, Severity::kMedium,
           "Filesystem path assembled from raw string pieces",
           "Join paths with os.path.join or pathlib and validate them against a base directory",
           path_concatenation},
      Rule{"SEC-004", "Shell Command Execution", Category::kSecurity, Severity::kHigh,
           "Command executed through the system shell",
           "Call subprocess.run with an argument list and shell=False", shell_execution},
  };
}

}  // namespace cqa::rules
