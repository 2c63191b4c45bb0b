#include "lexrisk/expression/value.h"

#include <array>
#include <charconv>

namespace lexrisk::expression {

double as_double(const Value& value) {
  if (const auto* integer = std::get_if<std::int64_t>(&value)) {
    return static_cast<double>(*integer);
  }
  return std::get<double>(value);
}

bool truthy(const Value& value) noexcept {
  switch (value.index()) {
    case 0:
      return false;
    case 1:
      return *std::get_if<bool>(&value);
    case 2:
      return *std::get_if<std::int64_t>(&value) != 0;
    case 3:
      return *std::get_if<double>(&value) != 0.0;
    case 4:
      return !std::get_if<std::string>(&value)->empty();
    default:
      return false;
  }
}

std::string to_display_string(const Value& value) {
  switch (value.index()) {
    case 0:
      return "null";
    case 1:
      return *std::get_if<bool>(&value) ? "true" : "false";
    case 2:
      return std::to_string(*std::get_if<std::int64_t>(&value));
    case 3: {
      std::array<char, 64> buffer{};
      const auto [end, ec] =
          std::to_chars(buffer.data(), buffer.data() + buffer.size(), *std::get_if<double>(&value));
      if (ec != std::errc{}) {
        return "nan";
      }
      return std::string(buffer.data(), end);
    }
    case 4:
      return *std::get_if<std::string>(&value);
    default:
      return "null";
  }
}

std::string_view type_name(const Value& value) noexcept {
  switch (value.index()) {
    case 1:
      return "bool";
    case 2:
      return "integer";
    case 3:
      return "decimal";
    case 4:
      return "string";
    default:
      return "null";
  }
}

}  // namespace lexrisk::expression
