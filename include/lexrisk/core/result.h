#pragma once

#include <cstddef>
#include <utility>
#include <variant>

namespace lexrisk::core {

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// Used at the storage boundary, where a failure is an expected outcome the caller must inspect.
// Alternatives are addressed by index, so T and E may be the same type.
//
// Usage: return Result<Value, Error>::ok(val) or Result<Value, Error>::err(error).
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const noexcept { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename U>
  Result(std::in_place_index_t<I> tag, U&& payload) : data_(tag, std::forward<U>(payload)) {}

  std::variant<T, E> data_;
};

}  // namespace lexrisk::core
