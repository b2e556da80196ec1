#include "cqa/source/line_scanner.h"

#include "cqa/core/text.h"

#include <string_view>
#include <utility>

namespace cqa::source {

namespace {

constexpr int kTabWidth = 8;

struct OpenBracket {
  char symbol;
  int line;
};

// Lexer state carried across physical lines.
struct LexState {
  bool in_string{false};
  bool triple{false};
  char quote{'"'};
  int string_line{0};
  bool pending_backslash{false};
  std::vector<OpenBracket> brackets;

  [[nodiscard]] bool statement_open() const {
    return in_string || pending_backslash || !brackets.empty();
  }
};

char closing_for(const char open) {
  switch (open) {
    case '(':
      return ')';
    case '[':
      return ']';
    default:
      return '}';
  }
}

int measure_indent(const std::string_view line) {
  int width = 0;
  for (const char ch : line) {
    if (ch == ' ') {
      ++width;
    } else if (ch == '\t') {
      width = (width / kTabWidth + 1) * kTabWidth;
    } else if (ch == '\f') {
      width = 0;
    } else {
      break;
    }
  }
  return width;
}

// mask_line lexes one physical line, updating state. Returns an error reason on failure.
std::optional<std::string> mask_line(const std::string& raw, const int line_number,
                                     LexState& state, std::string& code) {
  code.assign(raw.size(), ' ');
  state.pending_backslash = false;

  std::size_t i = 0;
  while (i < raw.size()) {
    const char ch = raw[i];

    if (state.in_string) {
      if (ch == '\\') {
        if (i + 1 == raw.size()) {
          // Escaped newline: a single-quoted string continues on the next line.
          state.pending_backslash = true;
        }
        i += 2;
        continue;
      }
      if (ch == state.quote) {
        if (!state.triple) {
          code[i] = ch;
          state.in_string = false;
          ++i;
          continue;
        }
        if (i + 2 < raw.size() && raw[i + 1] == state.quote && raw[i + 2] == state.quote) {
          code[i] = ch;
          code[i + 1] = ch;
          code[i + 2] = ch;
          state.in_string = false;
          i += 3;
          continue;
        }
      }
      ++i;
      continue;
    }

    if (ch == '#') {
      break;  // Comment runs to end of line and stays masked.
    }

    if (ch == '"' || ch == '\'') {
      const bool triple = i + 2 < raw.size() && raw[i + 1] == ch && raw[i + 2] == ch;
      state.in_string = true;
      state.triple = triple;
      state.quote = ch;
      state.string_line = line_number;
      const std::size_t width = triple ? 3 : 1;
      for (std::size_t k = 0; k < width; ++k) {
        code[i + k] = ch;
      }
      i += width;
      continue;
    }

    if (ch == '(' || ch == '[' || ch == '{') {
      state.brackets.push_back(OpenBracket{ch, line_number});
    } else if (ch == ')' || ch == ']' || ch == '}') {
      if (state.brackets.empty()) {
        return std::string("unmatched '") + ch + "'";
      }
      if (closing_for(state.brackets.back().symbol) != ch) {
        return std::string("closing '") + ch + "' does not match '" +
               state.brackets.back().symbol + "'";
      }
      state.brackets.pop_back();
    } else if (ch == '\\' && i + 1 == raw.size()) {
      state.pending_backslash = true;
    }

    code[i] = ch;
    ++i;
  }

  if (state.in_string && !state.triple && !state.pending_backslash) {
    return std::string("unterminated string literal");
  }

  return std::nullopt;
}

std::optional<ScanError> check_encoding(const SourceUnit& unit) {
  std::size_t bad_offset = 0;
  for (std::size_t n = 0; n < unit.lines().size(); ++n) {
    const auto& line = unit.lines()[n];
    if (!core::is_valid_utf8(line, &bad_offset)) {
      return ScanError{static_cast<int>(n + 1), "invalid UTF-8 sequence at column " +
                                                    std::to_string(bad_offset + 1)};
    }
    if (line.find('\0') != std::string::npos) {
      return ScanError{static_cast<int>(n + 1), "null byte in source"};
    }
  }
  return std::nullopt;
}

// Validates the block structure implied by indentation and links each statement
// to its enclosing block header.
std::optional<ScanError> link_blocks(std::vector<LogicalLine>& statements) {
  std::vector<int> levels{0};
  std::vector<std::size_t> headers;  // Statement indices, innermost last
  bool expect_block = false;

  for (std::size_t i = 0; i < statements.size(); ++i) {
    auto& stmt = statements[i];

    if (stmt.indent > levels.back()) {
      if (!expect_block) {
        return ScanError{stmt.first_line, "unexpected indent"};
      }
      levels.push_back(stmt.indent);
    } else {
      if (expect_block) {
        return ScanError{stmt.first_line, "expected an indented block"};
      }
      while (stmt.indent < levels.back()) {
        levels.pop_back();
      }
      if (stmt.indent != levels.back()) {
        return ScanError{stmt.first_line,
                         "unindent does not match any outer indentation level"};
      }
    }

    while (!headers.empty() && statements[headers.back()].indent >= stmt.indent) {
      headers.pop_back();
    }
    if (!headers.empty()) {
      stmt.parent = headers.back();
    }
    headers.push_back(i);

    expect_block = opens_block(stmt);
  }

  if (expect_block) {
    return ScanError{statements.back().last_line, "expected an indented block"};
  }

  return std::nullopt;
}

}  // namespace

bool opens_block(const LogicalLine& statement) {
  const std::string_view code = core::trim_view(statement.code);
  return !code.empty() && code.back() == ':';
}

core::Result<ScannedSource, ScanError> scan_source(const SourceUnit& unit) {
  using ScanResult = core::Result<ScannedSource, ScanError>;

  if (auto encoding_error = check_encoding(unit)) {
    return ScanResult::err(std::move(*encoding_error));
  }

  ScannedSource scanned;
  scanned.lines.reserve(unit.line_count());

  LexState state;
  std::optional<LogicalLine> current;

  for (std::size_t n = 0; n < unit.line_count(); ++n) {
    const std::string& raw = unit.lines()[n];
    const int line_number = static_cast<int>(n + 1);

    LineFacts facts;
    facts.continuation = state.statement_open();
    facts.starts_in_string = state.in_string;
    facts.indent = facts.continuation ? 0 : measure_indent(raw);

    if (auto reason = mask_line(raw, line_number, state, facts.code)) {
      return ScanResult::err(ScanError{line_number, std::move(*reason)});
    }

    facts.has_code = !core::trim_view(facts.code).empty();
    facts.comment_only =
        !facts.continuation && !facts.has_code && core::trim_view(raw).starts_with("#");

    if (facts.continuation) {
      if (current.has_value()) {
        current->last_line = line_number;
        current->code += '\n';
        current->code += facts.code;
        current->text += '\n';
        current->text += raw;
      }
    } else if (facts.has_code) {
      current = LogicalLine{line_number, line_number, facts.indent, facts.code, raw, std::nullopt};
    }

    if (current.has_value() && !state.statement_open()) {
      scanned.statements.push_back(std::move(*current));
      current.reset();
    }

    scanned.lines.push_back(std::move(facts));
  }

  if (state.in_string) {
    return ScanResult::err(ScanError{state.string_line, state.triple
                                                            ? "unterminated triple-quoted string"
                                                            : "unterminated string literal"});
  }
  if (!state.brackets.empty()) {
    const auto& open = state.brackets.back();
    return ScanResult::err(
        ScanError{open.line, std::string("'") + open.symbol + "' was never closed"});
  }
  if (current.has_value()) {
    // Trailing backslash on the final line.
    return ScanResult::err(ScanError{current->last_line, "unexpected end of file after '\\'"});
  }

  if (auto block_error = link_blocks(scanned.statements)) {
    return ScanResult::err(std::move(*block_error));
  }

  return ScanResult::ok(std::move(scanned));
}

}  // namespace cqa::source
