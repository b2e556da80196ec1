#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <string>
#include <string_view>

namespace cqa::core {

// Deterministic text utilities shared by the scanner, the extractor and rules.
// These functions are locale-independent and produce byte-stable output
// across all platforms and compilers (no std::isalpha / std::tolower).
// Case folding is ASCII-only; bytes of multi-byte UTF-8 sequences are treated
// as identifier characters because Python allows non-ASCII letters in names
// and the scanner rejects malformed UTF-8 before any of this runs.

inline bool is_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

inline bool is_ascii_upper(const char ch) { return ch >= 'A' && ch <= 'Z'; }

inline bool is_ascii_lower(const char ch) { return ch >= 'a' && ch <= 'z'; }

inline bool is_ascii_digit(const char ch) { return ch >= '0' && ch <= '9'; }

inline bool is_non_ascii(const char ch) { return static_cast<unsigned char>(ch) >= 0x80U; }

inline bool is_ident_start(const char ch) {
  return is_ascii_upper(ch) || is_ascii_lower(ch) || ch == '_' || is_non_ascii(ch);
}

inline bool is_ident_char(const char ch) { return is_ident_start(ch) || is_ascii_digit(ch); }

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
// Non-ASCII characters are preserved unchanged.
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (is_ascii_upper(ch)) {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

// trim_view removes leading and trailing ASCII whitespace without copying.
inline std::string_view trim_view(std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_space(input[start])) {
    ++start;
  }
  std::size_t end = input.size();
  while (end > start && is_space(input[end - 1])) {
    --end;
  }
  return input.substr(start, end - start);
}

inline std::string trim(const std::string_view input) { return std::string{trim_view(input)}; }

// leading_identifier returns the identifier at the start of input (after whitespace),
// or an empty view if input does not start with one.
inline std::string_view leading_identifier(std::string_view input) {
  input = trim_view(input);
  std::size_t end = 0;
  if (input.empty() || !is_ident_start(input[0])) {
    return {};
  }
  while (end < input.size() && is_ident_char(input[end])) {
    ++end;
  }
  return input.substr(0, end);
}

// starts_with_keyword is true when the trimmed input begins with keyword as a whole word.
inline bool starts_with_keyword(const std::string_view input, const std::string_view keyword) {
  return leading_identifier(input) == keyword;
}

// find_word locates needle in haystack where neither neighbour is an identifier character.
// Returns std::string_view::npos when absent.
inline std::size_t find_word(const std::string_view haystack, const std::string_view needle,
                             std::size_t from = 0) {
  if (needle.empty()) {
    return std::string_view::npos;
  }
  while (from <= haystack.size()) {
    const std::size_t pos = haystack.find(needle, from);
    if (pos == std::string_view::npos) {
      return pos;
    }
    const bool left_ok = pos == 0 || !is_ident_char(haystack[pos - 1]);
    const std::size_t after = pos + needle.size();
    const bool right_ok = after >= haystack.size() || !is_ident_char(haystack[after]);
    if (left_ok && right_ok) {
      return pos;
    }
    from = pos + 1;
  }
  return std::string_view::npos;
}

// is_dunder: "__init__", "__call__" and friends.
inline bool is_dunder(const std::string_view name) {
  return name.size() > 4 && name.starts_with("__") && name.ends_with("__");
}

// is_snake_case accepts lowercase letters, digits and underscores with at least one letter.
// Leading/trailing underscores (private names) are permitted. Non-ASCII letters count as
// letters of either case.
inline bool is_snake_case(const std::string_view name) {
  bool has_letter = false;
  for (const char ch : name) {
    if (is_ascii_lower(ch) || is_non_ascii(ch)) {
      has_letter = true;
    } else if (!is_ascii_digit(ch) && ch != '_') {
      return false;
    }
  }
  return has_letter;
}

// is_cap_words accepts "HttpClient", "_Private", "V2Parser"; rejects "http_client", "HTTP_X".
inline bool is_cap_words(std::string_view name) {
  while (!name.empty() && name.front() == '_') {
    name.remove_prefix(1);
  }
  if (name.empty() || !(is_ascii_upper(name.front()) || is_non_ascii(name.front()))) {
    return false;
  }
  for (const char ch : name) {
    if (!is_ascii_upper(ch) && !is_ascii_lower(ch) && !is_ascii_digit(ch) && !is_non_ascii(ch)) {
      return false;
    }
  }
  return true;
}

// utf8_length counts code points (bytes that are not UTF-8 continuation bytes).
inline std::size_t utf8_length(const std::string_view text) {
  std::size_t count = 0;
  for (const char ch : text) {
    if ((static_cast<unsigned char>(ch) & 0xC0U) != 0x80U) {
      ++count;
    }
  }
  return count;
}

// utf8_prefix returns the first max_code_points code points of text, never splitting a
// multi-byte sequence.
inline std::string_view utf8_prefix(const std::string_view text, const std::size_t max_code_points) {
  std::size_t count = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if ((static_cast<unsigned char>(text[i]) & 0xC0U) != 0x80U) {
      if (count == max_code_points) {
        return text.substr(0, i);
      }
      ++count;
    }
  }
  return text;
}

// is_valid_utf8 performs structural validation (lead/continuation bytes, overlong forms
// and surrogates are rejected). Returns the byte offset of the first bad sequence via
// bad_offset when provided.
inline bool is_valid_utf8(const std::string_view text, std::size_t* bad_offset = nullptr) {
  std::size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<unsigned char>(text[i]);
    std::size_t extra = 0;
    unsigned int code_point = 0;
    if (lead < 0x80U) {
      ++i;
      continue;
    }
    if ((lead & 0xE0U) == 0xC0U) {
      extra = 1;
      code_point = lead & 0x1FU;
    } else if ((lead & 0xF0U) == 0xE0U) {
      extra = 2;
      code_point = lead & 0x0FU;
    } else if ((lead & 0xF8U) == 0xF0U) {
      extra = 3;
      code_point = lead & 0x07U;
    } else {
      if (bad_offset != nullptr) {
        *bad_offset = i;
      }
      return false;
    }
    if (i + extra >= text.size()) {
      if (bad_offset != nullptr) {
        *bad_offset = i;
      }
      return false;
    }
    for (std::size_t k = 1; k <= extra; ++k) {
      const auto cont = static_cast<unsigned char>(text[i + k]);
      if ((cont & 0xC0U) != 0x80U) {
        if (bad_offset != nullptr) {
          *bad_offset = i;
        }
        return false;
      }
      code_point = (code_point << 6U) | (cont & 0x3FU);
    }
    constexpr std::array<unsigned int, 4> kMinForLength{0, 0x80U, 0x800U, 0x10000U};
    if (code_point < kMinForLength[extra] || code_point > 0x10FFFFU ||
        (code_point >= 0xD800U && code_point <= 0xDFFFU)) {
      if (bad_offset != nullptr) {
        *bad_offset = i;
      }
      return false;
    }
    i += extra + 1;
  }
  return true;
}

// shannon_entropy returns bits per character over the byte distribution of text.
inline double shannon_entropy(const std::string_view text) {
  if (text.empty()) {
    return 0.0;
  }
  std::array<std::size_t, 256> counts{};
  for (const char ch : text) {
    ++counts[static_cast<unsigned char>(ch)];
  }
  double entropy = 0.0;
  const auto total = static_cast<double>(text.size());
  for (const std::size_t count : counts) {
    if (count == 0) {
      continue;
    }
    const double p = static_cast<double>(count) / total;
    entropy -= p * std::log2(p);
  }
  return entropy;
}

}  // namespace cqa::core
