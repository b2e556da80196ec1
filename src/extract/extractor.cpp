#include "cqa/extract/extractor.h"

#include "cqa/core/text.h"

#include <algorithm>
#include <string_view>
#include <utility>

namespace cqa::extract {

namespace {

// Parsed def/class header line.
struct Header {
  ElementKind kind{ElementKind::kFunction};
  bool is_async{false};
  std::string name;
  std::string params;       // Text between the signature parentheses
  bool return_annotation{false};
  std::string inline_body;  // Text after the header colon (one-line bodies)
};

std::size_t skip_spaces(const std::string_view text, std::size_t pos) {
  while (pos < text.size() && core::is_space(text[pos])) {
    ++pos;
  }
  return pos;
}

// Index of the bracket closing the one at open_pos, or npos.
std::size_t find_matching_close(const std::string_view code, const std::size_t open_pos) {
  int depth = 0;
  for (std::size_t i = open_pos; i < code.size(); ++i) {
    const char ch = code[i];
    if (ch == '(' || ch == '[' || ch == '{') {
      ++depth;
    } else if (ch == ')' || ch == ']' || ch == '}') {
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string_view::npos;
}

// First occurrence of target at bracket depth zero, starting at from.
std::size_t find_top_level(const std::string_view code, const char target, std::size_t from) {
  int depth = 0;
  for (std::size_t i = from; i < code.size(); ++i) {
    const char ch = code[i];
    if (ch == '(' || ch == '[' || ch == '{') {
      ++depth;
    } else if (ch == ')' || ch == ']' || ch == '}') {
      --depth;
    } else if (ch == target && depth == 0) {
      return i;
    }
  }
  return std::string_view::npos;
}

std::optional<Header> parse_header(const std::string_view code) {
  Header header;
  std::size_t pos = skip_spaces(code, 0);

  std::string_view keyword = core::leading_identifier(code.substr(pos));
  if (keyword == "async") {
    header.is_async = true;
    pos = skip_spaces(code, pos + keyword.size());
    keyword = core::leading_identifier(code.substr(pos));
  }
  if (keyword == "def") {
    header.kind = ElementKind::kFunction;
  } else if (keyword == "class" && !header.is_async) {
    header.kind = ElementKind::kClass;
  } else {
    return std::nullopt;
  }

  pos = skip_spaces(code, pos + keyword.size());
  const std::string_view name = core::leading_identifier(code.substr(pos));
  if (name.empty()) {
    return std::nullopt;
  }
  header.name = std::string{name};
  pos += name.size();

  std::size_t search_from = pos;
  if (header.kind == ElementKind::kFunction) {
    const std::size_t open = skip_spaces(code, pos);
    if (open >= code.size() || code[open] != '(') {
      return std::nullopt;
    }
    const std::size_t close = find_matching_close(code, open);
    if (close == std::string_view::npos) {
      return std::nullopt;
    }
    header.params = std::string{code.substr(open + 1, close - open - 1)};
    const std::size_t after = skip_spaces(code, close + 1);
    header.return_annotation = code.substr(after).starts_with("->");
    search_from = close + 1;
  }

  const std::size_t colon = find_top_level(code, ':', search_from);
  if (colon == std::string_view::npos) {
    return std::nullopt;
  }
  header.inline_body = core::trim(code.substr(colon + 1));
  return header;
}

std::vector<Parameter> parse_parameters(const std::string_view params) {
  std::vector<Parameter> result;
  std::size_t start = 0;
  while (start <= params.size()) {
    std::size_t comma = find_top_level(params, ',', start);
    if (comma == std::string_view::npos) {
      comma = params.size();
    }
    std::string_view piece = core::trim_view(params.substr(start, comma - start));
    start = comma + 1;

    if (piece.empty() || piece == "*" || piece == "/") {
      continue;
    }
    while (!piece.empty() && piece.front() == '*') {
      piece.remove_prefix(1);
    }

    Parameter param;
    param.name = std::string{core::leading_identifier(piece)};
    if (param.name.empty()) {
      continue;
    }

    const std::size_t equals = find_top_level(piece, '=', 0);
    const std::string_view declaration =
        equals == std::string_view::npos ? piece : piece.substr(0, equals);
    param.annotated = find_top_level(declaration, ':', 0) != std::string_view::npos;
    if (equals != std::string_view::npos) {
      param.default_value = core::trim(piece.substr(equals + 1));
    }
    result.push_back(std::move(param));
  }
  return result;
}

// True when the masked code is exactly one string literal (a docstring candidate).
bool is_string_statement(const std::string_view code) {
  std::string_view text = core::trim_view(code);
  std::size_t prefix = 0;
  while (prefix < text.size() && prefix < 2 &&
         std::string_view("rRuUbBfF").find(text[prefix]) != std::string_view::npos) {
    ++prefix;
  }
  text.remove_prefix(prefix);
  if (text.empty() || (text.front() != '"' && text.front() != '\'')) {
    return false;
  }

  const char quote = text.front();
  const bool triple = text.size() >= 3 && text[1] == quote && text[2] == quote;
  const std::string delimiter(triple ? 3 : 1, quote);
  const std::size_t close = text.find(delimiter, delimiter.size());
  if (close == std::string_view::npos) {
    return false;
  }
  return core::trim_view(text.substr(close + delimiter.size())).empty();
}

bool is_decision_word(const std::string_view word) {
  return word == "if" || word == "elif" || word == "for" || word == "while" ||
         word == "except" || word == "and" || word == "or";
}

int count_decisions(const std::string_view code) {
  int decisions = 0;
  std::size_t i = 0;
  bool first_word = true;
  while (i < code.size()) {
    if (!core::is_ident_start(code[i])) {
      ++i;
      continue;
    }
    std::size_t end = i;
    while (end < code.size() && core::is_ident_char(code[end])) {
      ++end;
    }
    const std::string_view word = code.substr(i, end - i);
    if (is_decision_word(word) || (first_word && word == "case")) {
      ++decisions;
    }
    first_word = false;
    i = end;
  }
  return decisions;
}

bool is_ignored_for_hints(const Parameter& param) {
  return param.name == "self" || param.name == "cls";
}

}  // namespace

SourceMetrics compute_line_metrics(const source::SourceUnit& unit) {
  SourceMetrics metrics;
  metrics.total_lines = unit.line_count();
  for (const auto& line : unit.lines()) {
    const std::string_view stripped = core::trim_view(line);
    if (stripped.empty()) {
      ++metrics.blank_lines;
    } else if (stripped.front() == '#') {
      ++metrics.comment_lines;
    }
  }
  return metrics;
}

std::vector<std::size_t> child_elements(const std::vector<StructuralElement>& elements,
                                        const std::size_t index) {
  std::vector<std::size_t> children;
  for (std::size_t i = index + 1; i < elements.size(); ++i) {
    if (elements[i].parent == index) {
      children.push_back(i);
    }
  }
  return children;
}

ExtractionResult extract_structure(const source::SourceUnit& unit) {
  ExtractionResult result;
  result.metrics = compute_line_metrics(unit);

  auto scan = source::scan_source(unit);
  if (!scan.has_value()) {
    result.failure = scan.error();
    return result;
  }
  result.scanned = scan.take_value();

  const auto& statements = result.scanned.statements;
  std::vector<std::optional<std::size_t>> element_at(statements.size());
  std::vector<std::size_t> body_end;  // Per element: one past its last body statement
  std::vector<std::size_t> open_elements;

  // Pass 1: element boundaries and nesting.
  for (std::size_t s = 0; s < statements.size(); ++s) {
    const auto& stmt = statements[s];
    auto header = parse_header(stmt.code);
    if (!header.has_value()) {
      continue;
    }

    while (!open_elements.empty() &&
           statements[result.elements[open_elements.back()].statement_index].indent >=
               stmt.indent) {
      open_elements.pop_back();
    }

    std::size_t end = s + 1;
    while (end < statements.size() && statements[end].indent > stmt.indent) {
      ++end;
    }

    StructuralElement element;
    element.name = header->name;
    element.kind = header->kind;
    element.is_async = header->is_async;
    element.start_line = stmt.first_line;
    element.end_line = end > s + 1 ? statements[end - 1].last_line : stmt.last_line;
    element.nesting_depth = static_cast<int>(open_elements.size());
    if (!open_elements.empty()) {
      element.parent = open_elements.back();
    }
    element.statement_index = s;

    if (end > s + 1) {
      element.has_docstring = is_string_statement(statements[s + 1].code);
    } else {
      element.has_docstring = is_string_statement(header->inline_body);
    }

    if (element.kind == ElementKind::kFunction) {
      element.parameters = parse_parameters(header->params);
      element.has_return_annotation = header->return_annotation;
      element.has_type_hints =
          header->return_annotation ||
          std::any_of(element.parameters.begin(), element.parameters.end(),
                      [](const Parameter& p) { return p.annotated && !is_ignored_for_hints(p); });
    }

    element_at[s] = result.elements.size();
    open_elements.push_back(result.elements.size());
    body_end.push_back(end);
    result.elements.push_back(std::move(element));
  }

  // Pass 2: block depth and complexity over each function's own statements.
  for (std::size_t e = 0; e < result.elements.size(); ++e) {
    auto& element = result.elements[e];
    if (element.kind != ElementKind::kFunction) {
      continue;
    }
    const std::size_t begin = element.statement_index + 1;
    const std::size_t end = body_end[e];
    if (begin >= end) {
      continue;
    }

    std::vector<int> levels{statements[begin].indent};
    int depth = 0;
    int decisions = 0;
    std::size_t k = begin;
    while (k < end) {
      if (element_at[k].has_value()) {
        k = body_end[*element_at[k]];  // Nested definitions are measured on their own.
        continue;
      }
      const auto& stmt = statements[k];
      while (levels.size() > 1 && stmt.indent < levels.back()) {
        levels.pop_back();
      }
      if (stmt.indent > levels.back()) {
        levels.push_back(stmt.indent);
      }
      depth = std::max(depth, static_cast<int>(levels.size()) - 1);
      decisions += count_decisions(stmt.code);
      ++k;
    }
    element.block_depth = depth;
    element.complexity = 1 + decisions;
  }

  // Metrics.
  int total_function_length = 0;
  for (const auto& element : result.elements) {
    if (element.kind == ElementKind::kClass) {
      ++result.metrics.class_count;
      continue;
    }
    ++result.metrics.function_count;
    total_function_length += element.length();
    result.metrics.max_function_length =
        std::max(result.metrics.max_function_length, element.length());
  }
  if (result.metrics.function_count > 0) {
    result.metrics.average_function_length =
        static_cast<double>(total_function_length) /
        static_cast<double>(result.metrics.function_count);
  }

  return result;
}

}  // namespace cqa::extract
