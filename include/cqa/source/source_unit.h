#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace cqa::source {

// SourceUnit is the immutable text of one analyzed file plus its physical lines.
// Lines are 1-indexed through line(); lines() exposes the 0-indexed storage.
//
// Line endings are normalized to '\n' on construction and a UTF-8 byte order mark is
// dropped. A trailing newline does not produce an extra empty line; empty text has
// zero lines.
class SourceUnit {
 public:
  [[nodiscard]] static SourceUnit from_text(std::string name, std::string_view text);

  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  [[nodiscard]] const std::string& text() const noexcept { return text_; }
  [[nodiscard]] const std::vector<std::string>& lines() const noexcept { return lines_; }
  [[nodiscard]] std::size_t line_count() const noexcept { return lines_.size(); }

  // line(n) returns physical line n (1-indexed); out-of-range numbers yield "".
  [[nodiscard]] std::string_view line(std::size_t number) const noexcept;

 private:
  SourceUnit(std::string name, std::string text, std::vector<std::string> lines);

  std::string name_;
  std::string text_;
  std::vector<std::string> lines_;
};

/// Normalize line endings to \n (Unix style)
[[nodiscard]] std::string normalize_line_endings(std::string_view text);

}  // namespace cqa::source
