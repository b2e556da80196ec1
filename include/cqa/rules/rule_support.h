#pragma once

#include "cqa/extract/structural_element.h"
#include "cqa/source/line_scanner.h"

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace cqa::rules::support {

// Helpers shared by the built-in rule families. All of them read masked statement code
// (string contents and comments blanked), so matches never come from literals or comments.

// header_keyword returns the leading keyword of a statement, skipping "async".
[[nodiscard]] std::string_view header_keyword(const source::LogicalLine& statement);

// inline_body returns the trimmed text after the header colon of a compound statement
// ("except ValueError: pass" -> "pass"); empty when the body is on following lines.
[[nodiscard]] std::string inline_body(const source::LogicalLine& statement);

// Positions of calls to a builtin name ("print", "eval"): the name must not be an
// attribute ("x.print(") or a definition ("def print(").
[[nodiscard]] std::vector<std::size_t> find_builtin_calls(std::string_view code,
                                                          std::string_view name);

// Positions of calls to a dotted name ("os.system"): the name must not be the tail of a
// longer dotted path ("foo.os.system(").
[[nodiscard]] std::vector<std::size_t> find_dotted_calls(std::string_view code,
                                                         std::string_view dotted);

// call_arguments returns the text inside the parentheses of the call starting at pos.
[[nodiscard]] std::string_view call_arguments(std::string_view code, std::size_t pos);

// Physical line of byte offset pos inside the joined code/text of a statement.
[[nodiscard]] int line_at(const source::LogicalLine& statement, std::size_t pos);

// Statement indices whose parent is index, in source order.
[[nodiscard]] std::vector<std::size_t> direct_children(const source::ScannedSource& scanned,
                                                       std::size_t index);

// One past the last statement nested under index.
[[nodiscard]] std::size_t subtree_end(const source::ScannedSource& scanned, std::size_t index);

// enclosed_by walks the enclosing block headers of a statement, innermost first, and
// reports whether one of them starts with any of keywords. The walk stops at the
// nearest def/class header, which is checked but not crossed.
[[nodiscard]] bool enclosed_by(const source::ScannedSource& scanned, std::size_t index,
                               std::initializer_list<std::string_view> keywords);

// Statement indices in [first_line, last_line] (1-indexed, inclusive).
[[nodiscard]] std::vector<std::size_t> statements_between(const source::ScannedSource& scanned,
                                                          int first_line, int last_line);

// "Function 'load'" / "Class 'Loader'"
[[nodiscard]] std::string element_label(const extract::StructuralElement& element);

}  // namespace cqa::rules::support
