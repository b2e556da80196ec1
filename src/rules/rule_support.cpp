#include "cqa/rules/rule_support.h"

#include "cqa/core/text.h"

#include <algorithm>

namespace cqa::rules::support {

namespace {

std::size_t skip_spaces(const std::string_view text, std::size_t pos) {
  while (pos < text.size() && core::is_space(text[pos])) {
    ++pos;
  }
  return pos;
}

// The identifier immediately before pos (ignoring whitespace), or "".
std::string_view previous_word(const std::string_view code, std::size_t pos) {
  while (pos > 0 && core::is_space(code[pos - 1])) {
    --pos;
  }
  const std::size_t end = pos;
  while (pos > 0 && core::is_ident_char(code[pos - 1])) {
    --pos;
  }
  return code.substr(pos, end - pos);
}

bool followed_by_paren(const std::string_view code, const std::size_t after) {
  const std::size_t pos = skip_spaces(code, after);
  return pos < code.size() && code[pos] == '(';
}

}  // namespace

std::string_view header_keyword(const source::LogicalLine& statement) {
  const std::string_view code = core::trim_view(statement.code);
  const std::string_view first = core::leading_identifier(code);
  if (first == "async") {
    return core::leading_identifier(code.substr(first.size()));
  }
  return first;
}

std::string inline_body(const source::LogicalLine& statement) {
  const std::string_view code = statement.code;
  int depth = 0;
  for (std::size_t i = 0; i < code.size(); ++i) {
    const char ch = code[i];
    if (ch == '(' || ch == '[' || ch == '{') {
      ++depth;
    } else if (ch == ')' || ch == ']' || ch == '}') {
      --depth;
    } else if (ch == ':' && depth == 0) {
      return core::trim(code.substr(i + 1));
    }
  }
  return {};
}

std::vector<std::size_t> find_builtin_calls(const std::string_view code,
                                            const std::string_view name) {
  std::vector<std::size_t> positions;
  std::size_t from = 0;
  while (true) {
    const std::size_t pos = core::find_word(code, name, from);
    if (pos == std::string_view::npos) {
      break;
    }
    from = pos + name.size();

    if (pos > 0 && code[pos - 1] == '.') {
      continue;
    }
    const std::string_view before = previous_word(code, pos);
    if (before == "def" || before == "class") {
      continue;
    }
    if (followed_by_paren(code, pos + name.size())) {
      positions.push_back(pos);
    }
  }
  return positions;
}

std::vector<std::size_t> find_dotted_calls(const std::string_view code,
                                           const std::string_view dotted) {
  std::vector<std::size_t> positions;
  std::size_t from = 0;
  while (true) {
    const std::size_t pos = code.find(dotted, from);
    if (pos == std::string_view::npos) {
      break;
    }
    from = pos + 1;

    if (pos > 0 && (core::is_ident_char(code[pos - 1]) || code[pos - 1] == '.')) {
      continue;
    }
    if (followed_by_paren(code, pos + dotted.size())) {
      positions.push_back(pos);
    }
  }
  return positions;
}

std::string_view call_arguments(const std::string_view code, const std::size_t pos) {
  const std::size_t open = code.find('(', pos);
  if (open == std::string_view::npos) {
    return {};
  }
  int depth = 0;
  for (std::size_t i = open; i < code.size(); ++i) {
    if (code[i] == '(' || code[i] == '[' || code[i] == '{') {
      ++depth;
    } else if (code[i] == ')' || code[i] == ']' || code[i] == '}') {
      --depth;
      if (depth == 0) {
        return code.substr(open + 1, i - open - 1);
      }
    }
  }
  return code.substr(open + 1);
}

int line_at(const source::LogicalLine& statement, const std::size_t pos) {
  const std::string_view head = std::string_view(statement.code).substr(0, pos);
  const auto breaks = std::count(head.begin(), head.end(), '\n');
  return statement.first_line + static_cast<int>(breaks);
}

std::vector<std::size_t> direct_children(const source::ScannedSource& scanned,
                                         const std::size_t index) {
  std::vector<std::size_t> children;
  const auto& statements = scanned.statements;
  for (std::size_t j = index + 1;
       j < statements.size() && statements[j].indent > statements[index].indent; ++j) {
    if (statements[j].parent == index) {
      children.push_back(j);
    }
  }
  return children;
}

std::size_t subtree_end(const source::ScannedSource& scanned, const std::size_t index) {
  const auto& statements = scanned.statements;
  std::size_t j = index + 1;
  while (j < statements.size() && statements[j].indent > statements[index].indent) {
    ++j;
  }
  return j;
}

bool enclosed_by(const source::ScannedSource& scanned, const std::size_t index,
                 const std::initializer_list<std::string_view> keywords) {
  auto current = scanned.statements[index].parent;
  while (current.has_value()) {
    const auto& header = scanned.statements[*current];
    const std::string_view keyword = header_keyword(header);
    if (std::find(keywords.begin(), keywords.end(), keyword) != keywords.end()) {
      return true;
    }
    if (keyword == "def" || keyword == "class") {
      return false;
    }
    current = header.parent;
  }
  return false;
}

std::vector<std::size_t> statements_between(const source::ScannedSource& scanned,
                                            const int first_line, const int last_line) {
  std::vector<std::size_t> indices;
  for (std::size_t i = 0; i < scanned.statements.size(); ++i) {
    const auto& stmt = scanned.statements[i];
    if (stmt.first_line >= first_line && stmt.last_line <= last_line) {
      indices.push_back(i);
    }
  }
  return indices;
}

std::string element_label(const extract::StructuralElement& element) {
  const char* kind = element.kind == extract::ElementKind::kClass ? "Class" : "Function";
  return std::string(kind) + " '" + element.name + "'";
}

}  // namespace cqa::rules::support
