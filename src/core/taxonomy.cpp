#include "cqa/core/taxonomy.h"

namespace cqa::core {

std::string severity_to_string(const Severity severity) {
  switch (severity) {
    case Severity::kCritical:
      return "critical";
    case Severity::kHigh:
      return "high";
    case Severity::kMedium:
      return "medium";
    case Severity::kLow:
      return "low";
  }
  return "low";
}

std::optional<Severity> string_to_severity(const std::string_view value) {
  for (const auto severity : kSeveritiesDescending) {
    if (severity_to_string(severity) == value) {
      return severity;
    }
  }
  return std::nullopt;
}

std::string category_to_string(const Category category) {
  switch (category) {
    case Category::kStructure:
      return "structure";
    case Category::kErrorHandling:
      return "error_handling";
    case Category::kPerformance:
      return "performance";
    case Category::kSecurity:
      return "security";
    case Category::kMaintainability:
      return "maintainability";
    case Category::kBestPractices:
      return "best_practices";
  }
  return "structure";
}

std::optional<Category> string_to_category(const std::string_view value) {
  for (const auto category : kAllCategories) {
    if (category_to_string(category) == value) {
      return category;
    }
  }
  return std::nullopt;
}

std::string category_display_name(const Category category) {
  switch (category) {
    case Category::kStructure:
      return "Structure";
    case Category::kErrorHandling:
      return "Error Handling";
    case Category::kPerformance:
      return "Performance";
    case Category::kSecurity:
      return "Security";
    case Category::kMaintainability:
      return "Maintainability";
    case Category::kBestPractices:
      return "Best Practices";
  }
  return "Structure";
}

}  // namespace cqa::core
