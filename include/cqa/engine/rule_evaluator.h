#pragma once

#include "cqa/rules/issue.h"
#include "cqa/rules/rule.h"
#include "cqa/rules/rule_catalog.h"
#include "cqa/source/line_scanner.h"

#include <string>
#include <vector>

namespace cqa::engine {

// evaluate_rules runs every rule of the catalog against one context and returns the
// issues in report order: severity descending, then ascending line, then catalog
// registration order. Matches of one rule on one line keep their emission order.
//
// Every rule runs; none can suppress another. A rule that throws contributes no
// matches and is reported as a single low-severity "Rule Internal Error" issue in
// its own category.
[[nodiscard]] std::vector<rules::Issue> evaluate_rules(const rules::RuleCatalog& catalog,
                                                       const rules::RuleContext& context);

// The single critical issue reported for source that could not be decomposed.
[[nodiscard]] rules::Issue make_unparsable_issue(const source::ScanError& failure);

}  // namespace cqa::engine
