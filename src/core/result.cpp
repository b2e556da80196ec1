#include "cqa/core/result.h"

namespace cqa::core {

std::string config_error_code_to_string(const ConfigErrorCode code) {
  switch (code) {
    case ConfigErrorCode::kWeightSum:
      return "weight_sum";
    case ConfigErrorCode::kWeightRange:
      return "weight_range";
    case ConfigErrorCode::kMissingCategory:
      return "missing_category";
    case ConfigErrorCode::kDuplicateCategory:
      return "duplicate_category";
    case ConfigErrorCode::kNegativePenalty:
      return "negative_penalty";
    case ConfigErrorCode::kUnknownRule:
      return "unknown_rule";
    case ConfigErrorCode::kDuplicateRule:
      return "duplicate_rule";
    case ConfigErrorCode::kInvalidRule:
      return "invalid_rule";
    case ConfigErrorCode::kInvalidThreshold:
      return "invalid_threshold";
    case ConfigErrorCode::kInvalidFormat:
      return "invalid_format";
  }
  return "invalid_format";
}

std::string describe(const ConfigError& error) {
  return config_error_code_to_string(error.code) + ": " + error.detail;
}

}  // namespace cqa::core
