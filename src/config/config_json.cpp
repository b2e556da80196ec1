#include "cqa/config/config_json.h"

#include <nlohmann/json.hpp>

#include <utility>

namespace cqa::config {

namespace {

using json = nlohmann::json;
using ConfigResult = core::Result<RuleConfiguration, core::ConfigError>;

core::ConfigError format_error(std::string detail) {
  return core::ConfigError{core::ConfigErrorCode::kInvalidFormat, std::move(detail)};
}

// Integer threshold fields, by JSON key.
int* int_threshold(RuleThresholds& t, const std::string& key) {
  if (key == "max_function_length") {
    return &t.max_function_length;
  }
  if (key == "warn_function_length") {
    return &t.warn_function_length;
  }
  if (key == "max_nesting_depth") {
    return &t.max_nesting_depth;
  }
  if (key == "max_class_methods") {
    return &t.max_class_methods;
  }
  if (key == "max_complexity") {
    return &t.max_complexity;
  }
  if (key == "max_line_length") {
    return &t.max_line_length;
  }
  return nullptr;
}

bool* bool_threshold(RuleThresholds& t, const std::string& key) {
  if (key == "require_docstrings") {
    return &t.require_docstrings;
  }
  if (key == "require_type_hints") {
    return &t.require_type_hints;
  }
  return nullptr;
}

std::optional<core::ConfigError> read_thresholds(const json& section, RuleThresholds& t) {
  if (!section.is_object()) {
    return format_error("\"thresholds\" must be an object");
  }
  for (const auto& [key, value] : section.items()) {
    if (int* field = int_threshold(t, key)) {
      if (!value.is_number_integer()) {
        return format_error("threshold " + key + " must be an integer");
      }
      *field = value.get<int>();
    } else if (bool* flag = bool_threshold(t, key)) {
      if (!value.is_boolean()) {
        return format_error("threshold " + key + " must be a boolean");
      }
      *flag = value.get<bool>();
    } else {
      return format_error("unknown threshold " + key);
    }
  }
  return std::nullopt;
}

std::optional<core::ConfigError> read_rules(const json& section, RuleConfiguration& config) {
  if (!section.is_object()) {
    return format_error("\"rules\" must be an object");
  }
  for (const auto& [rule_id, entry] : section.items()) {
    if (!entry.is_object()) {
      return format_error("rule " + rule_id + " must map to an object");
    }
    for (const auto& [key, value] : entry.items()) {
      if (key == "enabled") {
        if (!value.is_boolean()) {
          return format_error("rule " + rule_id + ": enabled must be a boolean");
        }
        config.enabled[rule_id] = value.get<bool>();
      } else if (key == "severity") {
        const auto severity =
            value.is_string() ? core::string_to_severity(value.get<std::string>()) : std::nullopt;
        if (!severity.has_value()) {
          return format_error("rule " + rule_id + ": severity must be one of critical, high, "
                              "medium, low");
        }
        config.severity_overrides[rule_id] = *severity;
      } else {
        return format_error("rule " + rule_id + ": unknown key " + key);
      }
    }
  }
  return std::nullopt;
}

std::optional<core::ConfigError> read_weights(const json& section, RuleConfiguration& config) {
  if (!section.is_object()) {
    return format_error("\"weights\" must be an object");
  }
  for (const auto& [name, value] : section.items()) {
    const auto category = core::string_to_category(name);
    if (!category.has_value()) {
      return format_error("unknown category " + name);
    }
    if (!value.is_number()) {
      return format_error("weight of " + name + " must be a number");
    }
    config.weight_overrides[*category] = value.get<double>();
  }
  return std::nullopt;
}

}  // namespace

ConfigResult rule_configuration_from_json(const std::string_view text) {
  RuleConfiguration config;
  try {
    const json j = json::parse(text.begin(), text.end());
    if (!j.is_object()) {
      return ConfigResult::err(format_error("configuration must be a JSON object"));
    }

    for (const auto& [key, section] : j.items()) {
      std::optional<core::ConfigError> error;
      if (key == "thresholds") {
        error = read_thresholds(section, config.thresholds);
      } else if (key == "rules") {
        error = read_rules(section, config);
      } else if (key == "weights") {
        error = read_weights(section, config);
      } else {
        error = format_error("unknown section " + key);
      }
      if (error.has_value()) {
        return ConfigResult::err(std::move(*error));
      }
    }
  } catch (const json::exception& e) {
    return ConfigResult::err(format_error(e.what()));
  }

  return ConfigResult::ok(std::move(config));
}

std::string rule_configuration_to_json(const RuleConfiguration& config) {
  // nlohmann::json objects are std::map backed, so keys come out sorted.
  json j;

  const auto& t = config.thresholds;
  j["thresholds"] = {
      {"max_function_length", t.max_function_length},
      {"warn_function_length", t.warn_function_length},
      {"max_nesting_depth", t.max_nesting_depth},
      {"max_class_methods", t.max_class_methods},
      {"max_complexity", t.max_complexity},
      {"max_line_length", t.max_line_length},
      {"require_docstrings", t.require_docstrings},
      {"require_type_hints", t.require_type_hints},
  };

  json rules = json::object();
  for (const auto& [rule_id, enabled] : config.enabled) {
    rules[rule_id]["enabled"] = enabled;
  }
  for (const auto& [rule_id, severity] : config.severity_overrides) {
    rules[rule_id]["severity"] = core::severity_to_string(severity);
  }
  j["rules"] = rules;

  json weights = json::object();
  for (const auto& [category, weight] : config.weight_overrides) {
    weights[core::category_to_string(category)] = weight;
  }
  j["weights"] = weights;

  return j.dump();
}

}  // namespace cqa::config
