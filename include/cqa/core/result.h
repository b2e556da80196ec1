#pragma once

#include <string>
#include <utility>
#include <variant>

namespace cqa::core {

// Error enumerations following E.14 (use purpose-designed types as error indicators).
// Configuration errors are surfaced before any analysis starts; input errors never are
// (they degrade the report instead, see engine::analyze).

enum class ConfigErrorCode {
  kWeightSum,
  kWeightRange,
  kMissingCategory,
  kDuplicateCategory,
  kNegativePenalty,
  kUnknownRule,
  kDuplicateRule,
  kInvalidRule,
  kInvalidThreshold,
  kInvalidFormat,
};

struct ConfigError {
  ConfigErrorCode code{ConfigErrorCode::kInvalidFormat};
  std::string detail;
};

[[nodiscard]] std::string config_error_code_to_string(ConfigErrorCode code);

// describe renders "<code>: <detail>" for diagnostics.
[[nodiscard]] std::string describe(const ConfigError& error);

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
// The has_value() check makes error handling mandatory and visible at call sites.
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

  // Moves the success value out; only valid when has_value() is true.
  [[nodiscard]] T take_value() { return std::move(std::get<0>(data_)); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

}  // namespace cqa::core
