#include "cqa/rules/rule_catalog.h"

#include "cqa/rules/builtin_rules.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace cqa::rules {

namespace {

core::ConfigError make_error(const core::ConfigErrorCode code, std::string detail) {
  return core::ConfigError{code, std::move(detail)};
}

std::optional<core::ConfigError> check_threshold(const char* name, const int value) {
  if (value <= 0) {
    return make_error(core::ConfigErrorCode::kInvalidThreshold,
                      std::string(name) + " must be positive, got " + std::to_string(value));
  }
  return std::nullopt;
}

}  // namespace

std::optional<core::ConfigError> RuleCatalog::register_rule(Rule rule) {
  if (rule.rule_id.empty()) {
    return make_error(core::ConfigErrorCode::kInvalidRule, "rule id must not be empty");
  }
  if (!rule.evaluate) {
    return make_error(core::ConfigErrorCode::kInvalidRule,
                      "rule " + rule.rule_id + " has no predicate");
  }
  if (contains(rule.rule_id)) {
    return make_error(core::ConfigErrorCode::kDuplicateRule,
                      "rule " + rule.rule_id + " is already registered");
  }
  rules_.push_back(std::move(rule));
  return std::nullopt;
}

const Rule* RuleCatalog::find(const std::string_view rule_id) const noexcept {
  const auto it = std::find_if(rules_.begin(), rules_.end(),
                               [rule_id](const Rule& rule) { return rule.rule_id == rule_id; });
  return it == rules_.end() ? nullptr : &*it;
}

RuleCatalog make_default_catalog() {
  RuleCatalog catalog;

  // Rules in fixed registration order (deterministic tie-break)
  for (auto* factory : {&structure_rules, &error_handling_rules, &performance_rules,
                        &security_rules, &maintainability_rules, &best_practice_rules}) {
    for (auto& rule : factory()) {
      if (auto error = catalog.register_rule(std::move(rule))) {
        throw std::logic_error("built-in rule catalog is inconsistent: " + core::describe(*error));
      }
    }
  }

  return catalog;
}

std::optional<core::ConfigError> validate_configuration(const config::RuleConfiguration& config,
                                                        const RuleCatalog& catalog) {
  for (const auto& entry : config.enabled) {
    if (!catalog.contains(entry.first)) {
      return make_error(core::ConfigErrorCode::kUnknownRule,
                        "enable/disable override references unknown rule " + entry.first);
    }
  }
  for (const auto& entry : config.severity_overrides) {
    if (!catalog.contains(entry.first)) {
      return make_error(core::ConfigErrorCode::kUnknownRule,
                        "severity override references unknown rule " + entry.first);
    }
  }

  const auto& t = config.thresholds;
  for (const auto& [name, value] :
       {std::pair{"max_function_length", t.max_function_length},
        std::pair{"warn_function_length", t.warn_function_length},
        std::pair{"max_nesting_depth", t.max_nesting_depth},
        std::pair{"max_class_methods", t.max_class_methods},
        std::pair{"max_complexity", t.max_complexity},
        std::pair{"max_line_length", t.max_line_length}}) {
    if (auto error = check_threshold(name, value)) {
      return error;
    }
  }
  if (t.warn_function_length >= t.max_function_length) {
    return make_error(core::ConfigErrorCode::kInvalidThreshold,
                      "warn_function_length must be below max_function_length");
  }

  return std::nullopt;
}

core::Result<RuleCatalog, core::ConfigError> apply_configuration(
    const RuleCatalog& catalog, const config::RuleConfiguration& config) {
  using CatalogResult = core::Result<RuleCatalog, core::ConfigError>;

  if (auto error = validate_configuration(config, catalog)) {
    return CatalogResult::err(std::move(*error));
  }

  RuleCatalog configured;
  for (const auto& rule : catalog.rules()) {
    const auto enabled = config.enabled.find(rule.rule_id);
    if (enabled != config.enabled.end() && !enabled->second) {
      continue;
    }
    Rule copy = rule;
    const auto severity = config.severity_overrides.find(rule.rule_id);
    if (severity != config.severity_overrides.end()) {
      copy.severity = severity->second;
    }
    if (auto error = configured.register_rule(std::move(copy))) {
      return CatalogResult::err(std::move(*error));
    }
  }

  return CatalogResult::ok(std::move(configured));
}

}  // namespace cqa::rules
