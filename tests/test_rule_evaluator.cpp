#include "cqa/engine/rule_evaluator.h"
#include "cqa/extract/extractor.h"

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace cqa;
using namespace cqa::engine;
using core::Category;
using core::Severity;

namespace {

rules::Rule make_rule(std::string id, Severity severity, std::string suggestion,
                      std::vector<rules::RuleMatch> matches) {
  std::string title = "Title " + id;
  return rules::Rule{std::move(id),
                     std::move(title),
                     Category::kBestPractices,
                     severity,
                     "description",
                     std::move(suggestion),
                     [matches](const rules::RuleContext&) { return matches; }};
}

struct EmptyContext {
  source::SourceUnit unit = source::SourceUnit::from_text("empty.py", "");
  extract::ExtractionResult extraction = extract::extract_structure(unit);
  config::RuleThresholds thresholds{};

  rules::RuleContext context() const {
    return rules::RuleContext{unit, extraction.scanned, extraction.elements, thresholds};
  }
};

}  // namespace

TEST_CASE("evaluate_rules orders by severity, line, then registration", "[engine][evaluator]") {
  rules::RuleCatalog catalog;
  REQUIRE_FALSE(catalog
                    .register_rule(make_rule("A-1", Severity::kLow, "fix a",
                                             {{5, "a five", "", {}}, {2, "a two", "", {}}}))
                    .has_value());
  REQUIRE_FALSE(
      catalog.register_rule(make_rule("B-1", Severity::kCritical, "fix b", {{9, "b", "", {}}}))
          .has_value());
  REQUIRE_FALSE(catalog
                    .register_rule(make_rule("C-1", Severity::kLow, "",
                                             {{2, "c two", "", std::string("own")}}))
                    .has_value());
  REQUIRE_FALSE(
      catalog.register_rule(make_rule("D-1", Severity::kMedium, "", {{1, "d", "", {}}}))
          .has_value());

  const EmptyContext ctx;
  const auto issues = evaluate_rules(catalog, ctx.context());
  REQUIRE(issues.size() == 5);

  CHECK(issues[0].rule_id == "B-1");
  CHECK(issues[1].rule_id == "D-1");
  CHECK(issues[2].rule_id == "A-1");
  CHECK(issues[2].line == 2);
  CHECK(issues[3].rule_id == "C-1");
  CHECK(issues[3].line == 2);
  CHECK(issues[4].rule_id == "A-1");
  CHECK(issues[4].line == 5);
}

TEST_CASE("evaluate_rules copies rule metadata and default suggestions", "[engine][evaluator]") {
  rules::RuleCatalog catalog;
  REQUIRE_FALSE(catalog
                    .register_rule(make_rule("A-1", Severity::kHigh, "default fix",
                                             {{3, "msg", "evidence", {}}}))
                    .has_value());
  REQUIRE_FALSE(
      catalog.register_rule(make_rule("B-1", Severity::kLow, "", {{4, "other", "", {}}}))
          .has_value());

  const EmptyContext ctx;
  const auto issues = evaluate_rules(catalog, ctx.context());
  REQUIRE(issues.size() == 2);
  CHECK(issues[0].title == "Title A-1");
  CHECK(issues[0].category == Category::kBestPractices);
  CHECK(issues[0].severity == Severity::kHigh);
  CHECK(issues[0].message == "msg");
  CHECK(issues[0].evidence == "evidence");
  CHECK(issues[0].suggestion == std::optional<std::string>{"default fix"});
  CHECK_FALSE(issues[1].suggestion.has_value());
}

TEST_CASE("A throwing rule becomes one internal error and others still run",
          "[engine][evaluator]") {
  rules::RuleCatalog catalog;
  REQUIRE_FALSE(catalog
                    .register_rule(rules::Rule{"BAD-1", "Broken", Category::kSecurity,
                                               Severity::kCritical, "", "",
                                               [](const rules::RuleContext&)
                                                   -> std::vector<rules::RuleMatch> {
                                                 throw std::runtime_error("boom");
                                               }})
                    .has_value());
  REQUIRE_FALSE(
      catalog.register_rule(make_rule("OK-1", Severity::kMedium, "", {{7, "fine", "", {}}}))
          .has_value());

  const EmptyContext ctx;
  const auto issues = evaluate_rules(catalog, ctx.context());
  REQUIRE(issues.size() == 2);
  CHECK(issues[0].rule_id == "OK-1");
  CHECK(issues[1].rule_id == "BAD-1");
  CHECK(issues[1].severity == Severity::kLow);
  CHECK(issues[1].category == Category::kSecurity);
  CHECK(issues[1].title == "Rule Internal Error");
  CHECK(issues[1].line == 0);
  CHECK(issues[1].message == "Rule BAD-1 failed: boom");
}

TEST_CASE("make_unparsable_issue describes the scan failure", "[engine][evaluator]") {
  const auto issue = make_unparsable_issue(source::ScanError{4, "unexpected indent"});
  CHECK(issue.rule_id == "SYS-001");
  CHECK(issue.severity == Severity::kCritical);
  CHECK(issue.category == Category::kStructure);
  CHECK(issue.title == "Unparsable Source");
  CHECK(issue.line == 4);
  CHECK(issue.message == "Source could not be decomposed: unexpected indent");
  CHECK(issue.suggestion.has_value());
}
