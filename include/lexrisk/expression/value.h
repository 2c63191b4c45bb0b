#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <variant>

namespace lexrisk::expression {

// Value is the closed set of fact types a rule can observe.
// Alternative order is part of the contract (index() is used for type checks):
//   0 null, 1 bool, 2 integer, 3 decimal, 4 string.
using Value = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

// VariableEnvironment is the flat, read-only set of case facts.
// std::map keeps iteration (and therefore serialization and hashing) ordered by name.
using VariableEnvironment = std::map<std::string, Value, std::less<>>;

[[nodiscard]] constexpr bool is_null(const Value& value) noexcept {
  return std::holds_alternative<std::monostate>(value);
}

// Integers and decimals are numeric; booleans are not.
[[nodiscard]] constexpr bool is_numeric(const Value& value) noexcept {
  return std::holds_alternative<std::int64_t>(value) || std::holds_alternative<double>(value);
}

// as_double widens a numeric value. Precondition: is_numeric(value).
[[nodiscard]] double as_double(const Value& value);

// truthy: false for null, false, 0, 0.0 and ""; true otherwise.
[[nodiscard]] bool truthy(const Value& value) noexcept;

// to_display_string renders a value for templates and diagnostics:
// "null", "true"/"false", decimal integers, shortest round-trip decimals, raw strings.
[[nodiscard]] std::string to_display_string(const Value& value);

[[nodiscard]] std::string_view type_name(const Value& value) noexcept;

}  // namespace lexrisk::expression
