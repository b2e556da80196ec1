#pragma once

#include "cqa/config/rule_configuration.h"
#include "cqa/extract/extractor.h"
#include "cqa/rules/rule_catalog.h"
#include "cqa/source/source_unit.h"

#include <catch2/catch_test_macros.hpp>

#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace cqa::test_support {

// python joins lines with '\n' and appends a final newline.
inline std::string python(const std::initializer_list<std::string_view> lines) {
  std::string text;
  for (const auto line : lines) {
    text += line;
    text += '\n';
  }
  return text;
}

inline const rules::RuleCatalog& default_catalog() {
  static const rules::RuleCatalog catalog = rules::make_default_catalog();
  return catalog;
}

// run_rule evaluates one built-in rule against text that must extract cleanly.
inline std::vector<rules::RuleMatch> run_rule(const std::string_view rule_id,
                                              const std::string_view text,
                                              const config::RuleThresholds& thresholds = {}) {
  const auto unit = source::SourceUnit::from_text("sample.py", text);
  const auto extraction = extract::extract_structure(unit);
  REQUIRE(extraction.ok());
  const rules::Rule* rule = default_catalog().find(rule_id);
  REQUIRE(rule != nullptr);
  const rules::RuleContext context{unit, extraction.scanned, extraction.elements, thresholds};
  return rule->evaluate(context);
}

inline std::vector<int> match_lines(const std::vector<rules::RuleMatch>& matches) {
  std::vector<int> lines;
  lines.reserve(matches.size());
  for (const auto& match : matches) {
    lines.push_back(match.line);
  }
  return lines;
}

}  // namespace cqa::test_support
