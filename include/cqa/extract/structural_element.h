#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cqa::extract {

enum class ElementKind {
  kFunction,
  kClass,
};

// Parameter of a function signature. self/cls are kept but never count as annotated.
struct Parameter {
  std::string name;               // Without leading '*' / '**'
  bool annotated{false};          // "name: type"
  std::string default_value;      // Masked default expression text; empty when none
};

// StructuralElement is one function (including methods) or class.
// Derived once per analysis run; never mutated after extraction.
struct StructuralElement {
  std::string name;
  ElementKind kind{ElementKind::kFunction};
  int start_line{0};  // The def/class line (decorators excluded)
  int end_line{0};    // Last physical line of the body, >= start_line
  int nesting_depth{0};                 // Number of enclosing functions/classes
  std::optional<std::size_t> parent;    // Index of the enclosing element
  std::size_t statement_index{0};       // Index of the header in ScannedSource::statements
  bool is_async{false};
  bool has_docstring{false};
  bool has_type_hints{false};           // Return annotation or any annotated parameter
  bool has_return_annotation{false};
  std::vector<Parameter> parameters;    // Empty for classes
  int block_depth{0};                   // Deepest compound nesting inside the own body
  int complexity{1};                    // 1 + decision points in the own body

  [[nodiscard]] int length() const noexcept { return end_line - start_line + 1; }
};

struct SourceMetrics {
  std::size_t total_lines{0};
  std::size_t blank_lines{0};
  std::size_t comment_lines{0};
  std::size_t function_count{0};
  std::size_t class_count{0};
  double average_function_length{0.0};
  int max_function_length{0};
};

}  // namespace cqa::extract
