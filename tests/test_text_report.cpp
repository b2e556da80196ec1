#include "cqa/engine/analysis_engine.h"
#include "cqa/report/text_report.h"

#include "test_support.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace cqa;
using cqa::test_support::default_catalog;
using cqa::test_support::python;
using source::SourceUnit;

namespace {

bool contains(const std::string& text, const std::string& needle) {
  return text.find(needle) != std::string::npos;
}

}  // namespace

TEST_CASE("star_rating bands", "[report][text]") {
  CHECK(report::star_rating(9.5) == "*****");
  CHECK(report::star_rating(9.0) == "*****");
  CHECK(report::star_rating(8.9) == "****-");
  CHECK(report::star_rating(5.0) == "***--");
  CHECK(report::star_rating(3.0) == "**---");
  CHECK(report::star_rating(2.9) == "*----");
}

TEST_CASE("render_text_report summarises scores, issues and verdict", "[report][text]") {
  const auto unit = SourceUnit::from_text("orders.py", python({
                                                           "def run():",
                                                           "    \"\"\"Run.\"\"\"",
                                                           "    try:",
                                                           "        work()",
                                                           "    except:",
                                                           "        print(1)",
                                                       }));
  const auto report = engine::analyze(unit, default_catalog());
  const std::string text = report::render_text_report(report);

  CHECK(text.starts_with(std::string(80, '=') + "\nCODE QUALITY REPORT - orders.py\n"));
  CHECK(contains(text, "Overall Quality Score: 9.5/10 *****\n"));
  CHECK(contains(text, "  - Error Handling: 8.0/10\n"));
  CHECK(contains(text, "  - Lines of Code: 6\n"));
  CHECK(contains(text, "  - Functions: 1\n"));
  CHECK(contains(text, "Issues Found: 3\n"));
  CHECK(contains(text, "  HIGH (1):\n    - Line 5: Bare Except Clause [ERR-001]\n"));
  CHECK(contains(text, "  LOW (2):\n"));
  CHECK(contains(text, "Verdict: Excellent - deploy immediately\n"));
  CHECK_FALSE(contains(text, "CRITICAL"));
}

TEST_CASE("render_text_report truncates long severity groups", "[report][text]") {
  const auto unit = SourceUnit::from_text("noisy.py", python({
                                                          "print(1)",
                                                          "print(2)",
                                                          "print(3)",
                                                          "print(4)",
                                                      }));
  const auto report = engine::analyze(unit, default_catalog());
  const std::string text = report::render_text_report(report, 2);

  CHECK(contains(text, "  LOW (4):\n"));
  CHECK(contains(text, "    - Line 2: Print Statement [BP-001]\n"));
  CHECK_FALSE(contains(text, "Line 3: Print Statement"));
  CHECK(contains(text, "    ... and 2 more\n"));
}

TEST_CASE("render_text_report omits the line for file-level issues", "[report][text]") {
  const auto report = engine::unreadable_report("gone.py", "Failed to open file: gone.py");
  const std::string text = report::render_text_report(report);
  CHECK(contains(text, "  CRITICAL (1):\n    - Unparsable Source [SYS-001]\n"));
  CHECK(contains(text, "Verdict: Not production ready - fix critical issues first\n"));
  CHECK_FALSE(contains(text, "Avg Function Length"));
}
