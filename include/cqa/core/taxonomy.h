#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace cqa::core {

// Severity is ordinal: kCritical > kHigh > kMedium > kLow.
enum class Severity {
  kLow,
  kMedium,
  kHigh,
  kCritical,
};

// The six fixed quality dimensions. Declaration order is the canonical report order.
enum class Category {
  kStructure,
  kErrorHandling,
  kPerformance,
  kSecurity,
  kMaintainability,
  kBestPractices,
};

inline constexpr std::array<Category, 6> kAllCategories{
    Category::kStructure,       Category::kErrorHandling,   Category::kPerformance,
    Category::kSecurity,        Category::kMaintainability, Category::kBestPractices,
};

inline constexpr std::array<Severity, 4> kSeveritiesDescending{
    Severity::kCritical,
    Severity::kHigh,
    Severity::kMedium,
    Severity::kLow,
};

// Stable machine names: "critical", "high", "medium", "low".
[[nodiscard]] std::string severity_to_string(Severity severity);
[[nodiscard]] std::optional<Severity> string_to_severity(std::string_view value);

// Stable machine names: "structure", "error_handling", ..., "best_practices".
[[nodiscard]] std::string category_to_string(Category category);
[[nodiscard]] std::optional<Category> string_to_category(std::string_view value);

// Human-readable title: "Structure", "Error Handling", ...
[[nodiscard]] std::string category_display_name(Category category);

}  // namespace cqa::core
