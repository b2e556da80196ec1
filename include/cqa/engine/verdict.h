#pragma once

#include <cstddef>
#include <string>

namespace cqa::engine {

enum class Verdict {
  kNotProductionReady,
  kPoor,
  kFair,
  kGood,
  kExcellent,
};

// Score band boundaries (lower bound inclusive), applied to the display score.
inline constexpr double kFairThreshold = 5.0;
inline constexpr double kGoodThreshold = 7.0;
inline constexpr double kExcellentThreshold = 9.0;

// classify maps the one-decimal display score to a verdict. Any critical issue forces
// kNotProductionReady regardless of score. High issues are accepted for signature
// symmetry with the report counts; they only influence the score.
[[nodiscard]] Verdict classify(double display_score, std::size_t critical_count,
                               std::size_t high_count);

// "Excellent - deploy immediately", ...
[[nodiscard]] std::string verdict_label(Verdict verdict);

// Stable machine names: "not_production_ready", "poor", "fair", "good", "excellent".
[[nodiscard]] std::string verdict_to_string(Verdict verdict);

// True for kGood and kExcellent.
[[nodiscard]] bool production_ready(Verdict verdict);

}  // namespace cqa::engine
