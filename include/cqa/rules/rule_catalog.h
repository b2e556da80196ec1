#pragma once

#include "cqa/config/rule_configuration.h"
#include "cqa/core/result.h"
#include "cqa/rules/rule.h"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace cqa::rules {

// RuleCatalog is a flat registry of rules in registration order.
// Registration order is the tertiary key of issue ordering; it never affects which
// matches a rule produces.
class RuleCatalog {
 public:
  // Rejects duplicate ids, empty ids and rules without a predicate.
  [[nodiscard]] std::optional<core::ConfigError> register_rule(Rule rule);

  [[nodiscard]] const Rule* find(std::string_view rule_id) const noexcept;
  [[nodiscard]] bool contains(std::string_view rule_id) const noexcept {
    return find(rule_id) != nullptr;
  }

  [[nodiscard]] const std::vector<Rule>& rules() const noexcept { return rules_; }
  [[nodiscard]] std::size_t size() const noexcept { return rules_.size(); }

 private:
  std::vector<Rule> rules_;
};

// make_default_catalog registers every built-in rule in fixed order:
// structure, error handling, performance, security, maintainability, best practices.
[[nodiscard]] RuleCatalog make_default_catalog();

// validate_configuration checks rule ids against the catalog and thresholds for sanity.
// Weight overrides are checked by scoring::apply_weight_overrides.
[[nodiscard]] std::optional<core::ConfigError> validate_configuration(
    const config::RuleConfiguration& config, const RuleCatalog& catalog);

// apply_configuration returns a new catalog with disabled rules removed and severity
// overrides applied. Registration order of the surviving rules is preserved.
[[nodiscard]] core::Result<RuleCatalog, core::ConfigError> apply_configuration(
    const RuleCatalog& catalog, const config::RuleConfiguration& config);

}  // namespace cqa::rules
