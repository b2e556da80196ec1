#include "cqa/scoring/scoring_policy.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace cqa::scoring {

namespace {

core::ConfigError make_error(const core::ConfigErrorCode code, std::string detail) {
  return core::ConfigError{code, std::move(detail)};
}

}  // namespace

double SeverityPenalties::for_severity(const core::Severity severity) const noexcept {
  switch (severity) {
    case core::Severity::kCritical:
      return critical;
    case core::Severity::kHigh:
      return high;
    case core::Severity::kMedium:
      return medium;
    case core::Severity::kLow:
      return low;
  }
  return low;
}

const CategoryPolicy* ScoringPolicy::find(const core::Category category) const noexcept {
  const auto it =
      std::find_if(categories.begin(), categories.end(),
                   [category](const CategoryPolicy& entry) { return entry.category == category; });
  return it == categories.end() ? nullptr : &*it;
}

std::optional<core::ConfigError> validate_policy(const ScoringPolicy& policy) {
  for (const auto category : core::kAllCategories) {
    const auto count = std::count_if(
        policy.categories.begin(), policy.categories.end(),
        [category](const CategoryPolicy& entry) { return entry.category == category; });
    if (count == 0) {
      return make_error(core::ConfigErrorCode::kMissingCategory,
                        "no weight for category " + core::category_to_string(category));
    }
    if (count > 1) {
      return make_error(core::ConfigErrorCode::kDuplicateCategory,
                        "category " + core::category_to_string(category) + " listed twice");
    }
  }

  double sum = 0.0;
  for (const auto& entry : policy.categories) {
    const std::string name = core::category_to_string(entry.category);
    if (!(entry.weight > 0.0 && entry.weight <= 1.0)) {
      return make_error(core::ConfigErrorCode::kWeightRange,
                        "weight of " + name + " must be in (0, 1]");
    }
    const auto& p = entry.penalties;
    if (p.critical < 0.0 || p.high < 0.0 || p.medium < 0.0 || p.low < 0.0) {
      return make_error(core::ConfigErrorCode::kNegativePenalty,
                        "penalties of " + name + " must not be negative");
    }
    sum += entry.weight;
  }

  if (std::abs(sum - 1.0) > kWeightSumTolerance) {
    std::ostringstream detail;
    detail << "category weights sum to " << std::setprecision(12) << sum << ", expected 1.0";
    return make_error(core::ConfigErrorCode::kWeightSum, detail.str());
  }

  return std::nullopt;
}

core::Result<ScoringPolicy, core::ConfigError> apply_weight_overrides(
    const ScoringPolicy& policy, const std::map<core::Category, double>& overrides) {
  using PolicyResult = core::Result<ScoringPolicy, core::ConfigError>;

  ScoringPolicy updated = policy;
  for (const auto& [category, weight] : overrides) {
    auto it = std::find_if(
        updated.categories.begin(), updated.categories.end(),
        [category = category](const CategoryPolicy& entry) { return entry.category == category; });
    if (it == updated.categories.end()) {
      return PolicyResult::err(make_error(core::ConfigErrorCode::kMissingCategory,
                                          "weight override for unlisted category " +
                                              core::category_to_string(category)));
    }
    it->weight = weight;
  }

  if (auto error = validate_policy(updated)) {
    return PolicyResult::err(std::move(*error));
  }
  return PolicyResult::ok(std::move(updated));
}

std::string policy_to_log_string(const ScoringPolicy& policy) {
  std::ostringstream out;
  out << std::fixed;
  bool first = true;
  for (const auto& entry : policy.categories) {
    if (!first) {
      out << ' ';
    }
    first = false;
    const auto& p = entry.penalties;
    out << core::category_to_string(entry.category) << '=' << std::setprecision(2)
        << entry.weight << '(' << std::setprecision(1) << p.critical << '/' << p.high << '/'
        << p.medium << '/' << p.low << ')';
  }
  return out.str();
}

}  // namespace cqa::scoring
