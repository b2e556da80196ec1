#include "cqa/source/source_unit.h"

#include <utility>

namespace cqa::source {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> lines;
  if (text.empty()) {
    return lines;
  }

  std::size_t start = 0;
  while (start < text.size()) {
    const std::size_t newline = text.find('\n', start);
    if (newline == std::string::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, newline - start));
    start = newline + 1;
  }

  return lines;
}

}  // namespace

std::string normalize_line_endings(const std::string_view text) {
  std::string result;
  result.reserve(text.size());

  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\r') {
      // Handle \r\n (Windows) and \r (old Mac)
      if (i + 1 < text.size() && text[i + 1] == '\n') {
        ++i;
      }
      result += '\n';
    } else {
      result += text[i];
    }
  }

  return result;
}

SourceUnit::SourceUnit(std::string name, std::string text, std::vector<std::string> lines)
    : name_(std::move(name)), text_(std::move(text)), lines_(std::move(lines)) {}

SourceUnit SourceUnit::from_text(std::string name, std::string_view text) {
  if (text.starts_with(kUtf8Bom)) {
    text.remove_prefix(kUtf8Bom.size());
  }
  std::string normalized = normalize_line_endings(text);
  auto lines = split_lines(normalized);
  return SourceUnit(std::move(name), std::move(normalized), std::move(lines));
}

std::string_view SourceUnit::line(const std::size_t number) const noexcept {
  if (number == 0 || number > lines_.size()) {
    return {};
  }
  return lines_[number - 1];
}

}  // namespace cqa::source
