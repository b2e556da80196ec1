#include "test_support.h"

#include <catch2/catch_test_macros.hpp>

#include <vector>

using cqa::config::RuleThresholds;
using cqa::test_support::match_lines;
using cqa::test_support::python;
using cqa::test_support::run_rule;

namespace {

const std::string kFunctions = python({
    "def short():",      // 1
    "    return 1",      // 2
    "",                  // 3
    "def medium():",     // 4
    "    a = 1",         // 5
    "    b = 2",         // 6
    "    return a + b",  // 7
    "",                  // 8
    "def long():",       // 9
    "    a = 1",         // 10
    "    b = 2",         // 11
    "    c = 3",         // 12
    "    d = 4",         // 13
    "    return a",      // 14
});

RuleThresholds small_lengths() {
  RuleThresholds thresholds;
  thresholds.warn_function_length = 3;
  thresholds.max_function_length = 5;
  return thresholds;
}

}  // namespace

TEST_CASE("STR-001 flags functions over the maximum length", "[rules][structure]") {
  const auto matches = run_rule("STR-001", kFunctions, small_lengths());
  REQUIRE(matches.size() == 1);
  CHECK(matches[0].line == 9);
  CHECK(matches[0].evidence == "long");
  CHECK(matches[0].message == "Function 'long' is 6 lines (>5)");
}

TEST_CASE("STR-002 warns only between the warning and maximum lengths", "[rules][structure]") {
  const auto matches = run_rule("STR-002", kFunctions, small_lengths());
  REQUIRE(matches.size() == 1);
  CHECK(matches[0].line == 4);
  CHECK(matches[0].evidence == "medium");
}

TEST_CASE("Length rules stay quiet under default thresholds", "[rules][structure]") {
  CHECK(run_rule("STR-001", kFunctions).empty());
  CHECK(run_rule("STR-002", kFunctions).empty());
}

TEST_CASE("STR-003 flags nesting deeper than the limit", "[rules][structure]") {
  const auto text = python({
      "def deep(items):",
      "    for item in items:",
      "        if item:",
      "            while item:",
      "                item -= 1",
      "def flat():",
      "    return 0",
  });
  RuleThresholds thresholds;
  thresholds.max_nesting_depth = 2;
  const auto matches = run_rule("STR-003", text, thresholds);
  REQUIRE(matches.size() == 1);
  CHECK(matches[0].line == 1);
  CHECK(matches[0].message == "Function 'deep' nests blocks 3 levels deep (>2)");

  CHECK(run_rule("STR-003", text).empty());
}

TEST_CASE("STR-004 counts direct methods of a class", "[rules][structure]") {
  const auto text = python({
      "class Service:",
      "    def start(self):",
      "        def inner():",
      "            return 1",
      "        return inner()",
      "    def stop(self):",
      "        return 2",
      "    def status(self):",
      "        return 3",
      "",
      "class Small:",
      "    def run(self):",
      "        return 4",
  });
  RuleThresholds thresholds;
  thresholds.max_class_methods = 2;
  const auto matches = run_rule("STR-004", text, thresholds);
  REQUIRE(matches.size() == 1);
  CHECK(matches[0].line == 1);
  CHECK(matches[0].message == "Class 'Service' defines 3 methods (>2)");

  thresholds.max_class_methods = 3;
  CHECK(run_rule("STR-004", text, thresholds).empty());
}

TEST_CASE("STR-005 flags functions over the complexity limit", "[rules][structure]") {
  const auto text = python({
      "def decide(a, b):",
      "    if a and b:",
      "        return 1",
      "    return 0",
  });
  RuleThresholds thresholds;
  thresholds.max_complexity = 2;
  const auto matches = run_rule("STR-005", text, thresholds);
  REQUIRE(matches.size() == 1);
  CHECK(matches[0].message == "Function 'decide' has cyclomatic complexity 3 (>2)");

  thresholds.max_complexity = 3;
  CHECK(run_rule("STR-005", text, thresholds).empty());
}

TEST_CASE("STR-006 reports the earliest line repeated more than twice", "[rules][structure]") {
  const auto text = python({
      "total = compute_total(values)",
      "total = compute_total(values)",
      "other = compute_total(values)",
      "other = compute_total(values)",
      "total = compute_total(values)",
  });
  const auto matches = run_rule("STR-006", text);
  REQUIRE(matches.size() == 1);
  CHECK(matches[0].line == 1);
  CHECK(matches[0].evidence == "total = compute_total(values)");
  CHECK(matches[0].message == "Line repeated 3 times; potential code duplication");
}

TEST_CASE("STR-006 ignores short lines, comments and pairs", "[rules][structure]") {
  const auto text = python({
      "x = 1",
      "x = 1",
      "x = 1",
      "# a comment that is long enough to count",
      "# a comment that is long enough to count",
      "# a comment that is long enough to count",
      "result = transform(values)",
      "result = transform(values)",
  });
  CHECK(run_rule("STR-006", text).empty());
}
