#pragma once

#include "cqa/core/result.h"
#include "cqa/source/source_unit.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cqa::source {

// LineFacts describes one physical line after lexical masking.
//
// code has exactly the length of the raw line: string literal contents and comments are
// replaced by spaces while quotes, brackets and operators stay in place. Column positions
// in code therefore address the same characters in the raw line.
struct LineFacts {
  std::string code;
  int indent{0};                 // Leading whitespace width (tab = next multiple of 8)
  bool has_code{false};          // Any non-space character left after masking
  bool comment_only{false};      // Starts outside any statement and holds only a comment
  bool starts_in_string{false};  // Begins inside a multi-line string literal
  bool continuation{false};      // Begins inside an open statement (string, bracket, '\')
};

// LogicalLine is one statement: a run of physical lines joined by open brackets,
// triple-quoted strings or backslash continuations.
struct LogicalLine {
  int first_line{0};  // 1-indexed
  int last_line{0};   // 1-indexed, >= first_line
  int indent{0};
  std::string code;  // Masked code of the physical lines joined with '\n'
  std::string text;  // Raw text of the physical lines joined with '\n'
  // Nearest preceding statement with a smaller indent (the enclosing block header).
  std::optional<std::size_t> parent;
};

struct ScannedSource {
  std::vector<LineFacts> lines;          // One entry per physical line
  std::vector<LogicalLine> statements;  // Statements in source order
};

// ScanError marks input that cannot be structurally decomposed.
struct ScanError {
  int line{0};
  std::string reason;
};

// scan_source performs a best-effort lexical pass over Python source text.
//
// Fails (never throws) on: invalid UTF-8, embedded NUL bytes, unterminated string
// literals, mismatched or unclosed brackets, unexpected indents, dedents that match no
// outer level and block headers without an indented body.
[[nodiscard]] core::Result<ScannedSource, ScanError> scan_source(const SourceUnit& unit);

// True when the statement code (trimmed) ends with ':' and opens an indented block.
[[nodiscard]] bool opens_block(const LogicalLine& statement);

}  // namespace cqa::source
