#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <variant>

namespace rqcd::core {

// Error enumerations following E.14 (use purpose-designed types as error indicators).

// InitErrorCode classifies failures that make an analyzer handle unusable.
// These abort startup; they are never reported as a per-statement result.
enum class InitErrorCode {
  kTokenizerUnavailable,    // Tokenizer resources missing and fallback not permitted
  kDegenerateTrainingData,  // Empty corpus, single class, bad label, or empty vocabulary
  kInvalidConfig,           // Threshold or trainer option out of range
};

struct InitError {
  InitErrorCode code{InitErrorCode::kInvalidConfig};
  std::string message;
};

[[nodiscard]] constexpr const char* to_string(const InitErrorCode code) noexcept {
  switch (code) {
    case InitErrorCode::kTokenizerUnavailable:
      return "tokenizer_unavailable";
    case InitErrorCode::kDegenerateTrainingData:
      return "degenerate_training_data";
    case InitErrorCode::kInvalidConfig:
      return "invalid_config";
  }
  return "unknown";
}

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
// The has_value() check makes error handling mandatory and visible at call sites.
//
// T and E must be distinct types (std::variant cannot disambiguate otherwise).
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

}  // namespace rqcd::core
