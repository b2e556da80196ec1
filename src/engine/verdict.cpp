#include "cqa/engine/verdict.h"

namespace cqa::engine {

Verdict classify(const double display_score, const std::size_t critical_count,
                 const std::size_t /*high_count*/) {
  if (critical_count > 0) {
    return Verdict::kNotProductionReady;
  }
  if (display_score >= kExcellentThreshold) {
    return Verdict::kExcellent;
  }
  if (display_score >= kGoodThreshold) {
    return Verdict::kGood;
  }
  if (display_score >= kFairThreshold) {
    return Verdict::kFair;
  }
  return Verdict::kPoor;
}

std::string verdict_label(const Verdict verdict) {
  switch (verdict) {
    case Verdict::kNotProductionReady:
      return "Not production ready - fix critical issues first";
    case Verdict::kPoor:
      return "Poor - major refactor required";
    case Verdict::kFair:
      return "Fair - significant improvements needed";
    case Verdict::kGood:
      return "Good - minor improvements, deployable with monitoring";
    case Verdict::kExcellent:
      return "Excellent - deploy immediately";
  }
  return "Poor - major refactor required";
}

std::string verdict_to_string(const Verdict verdict) {
  switch (verdict) {
    case Verdict::kNotProductionReady:
      return "not_production_ready";
    case Verdict::kPoor:
      return "poor";
    case Verdict::kFair:
      return "fair";
    case Verdict::kGood:
      return "good";
    case Verdict::kExcellent:
      return "excellent";
  }
  return "poor";
}

bool production_ready(const Verdict verdict) {
  return verdict == Verdict::kGood || verdict == Verdict::kExcellent;
}

}  // namespace cqa::engine
