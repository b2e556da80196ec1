#include "test_support.h"

#include <catch2/catch_test_macros.hpp>

#include <vector>

using cqa::test_support::match_lines;
using cqa::test_support::python;
using cqa::test_support::run_rule;

TEST_CASE("PRF-001 flags loops that only append", "[rules][performance]") {
  const auto text = python({
      "result = []",                             // 1
      "for item in items:",                      // 2
      "    result.append(item * 2)",             // 3
      "for item in items:",                      // 4
      "    if item:",                            // 5
      "        result.append(item)",             // 6
      "for item in items:",                      // 7
      "    result.append(item)",                 // 8
      "    count += 1",                          // 9
      "for item in items: result.append(item)",  // 10
      "for item in items:",                      // 11
      "    result.append(item).strip()",         // 12
  });
  const auto matches = run_rule("PRF-001", text);
  CHECK(match_lines(matches) == std::vector<int>{2, 4, 10});
  REQUIRE(matches.size() == 3);
  CHECK(matches[0].evidence == "for item in items:");
  CHECK(matches[2].evidence == "for item in items: result.append(item)");
}

TEST_CASE("PRF-002 flags nested loops over the same iterable", "[rules][performance]") {
  const auto text = python({
      "def pairs(items, other):",         // 1
      "    for a in items:",              // 2
      "        for b in items:",          // 3
      "            for c in items:",      // 4
      "                yield a, b, c",    // 5
      "    for a in items:",              // 6
      "        for b in other:",          // 7
      "            yield a, b",           // 8
      "    for a in items:",              // 9
      "        def inner():",             // 10
      "            for b in items:",      // 11
      "                yield b",          // 12
      "        yield inner",              // 13
  });
  const auto matches = run_rule("PRF-002", text);
  CHECK(match_lines(matches) == std::vector<int>{3, 4});
  REQUIRE_FALSE(matches.empty());
  CHECK(matches[0].evidence == "items");
}

TEST_CASE("PRF-002 compares the whole iterable expression", "[rules][performance]") {
  const auto text = python({
      "for key, value in table.items():",
      "    for other in table.items():",
      "        check(key, other)",
      "for key in table.keys():",
      "    for other in table.values():",
      "        check(key, other)",
  });
  const auto matches = run_rule("PRF-002", text);
  CHECK(match_lines(matches) == std::vector<int>{2});
  REQUIRE(matches.size() == 1);
  CHECK(matches[0].evidence == "table.items()");
}

TEST_CASE("PRF-003 flags string += inside loops", "[rules][performance]") {
  const auto text = python({
      "text = \"\"",                    // 1
      "for item in items:",             // 2
      "    text += \"x\"",              // 3
      "    count += 1",                 // 4
      "while running:",                 // 5
      "    label += str(n) + \",\"",    // 6
      "text += \"done\"",               // 7
      "for item in items:",             // 8
      "    def helper():",              // 9
      "        out += \"y\"",           // 10
      "    helper()",                   // 11
  });
  const auto matches = run_rule("PRF-003", text);
  CHECK(match_lines(matches) == std::vector<int>{3, 6});
  REQUIRE(matches.size() == 2);
  CHECK(matches[0].evidence == "text");
  CHECK(matches[1].evidence == "label");
  CHECK(matches[0].message == "String 'text' is built with += inside a loop");
}
