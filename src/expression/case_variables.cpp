#include "lexrisk/expression/case_variables.h"

#include "lexrisk/core/sha256.h"

#include <cstdint>
#include <limits>
#include <stdexcept>

namespace lexrisk::expression {

Value value_from_json(const nlohmann::json& j) {
  if (j.is_null()) {
    return Value{};
  }
  if (j.is_boolean()) {
    return Value{j.get<bool>()};
  }
  if (j.is_number_integer()) {
    if (j.is_number_unsigned()) {
      const auto u = j.get<std::uint64_t>();
      if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return Value{static_cast<double>(u)};
      }
      return Value{static_cast<std::int64_t>(u)};
    }
    return Value{j.get<std::int64_t>()};
  }
  if (j.is_number_float()) {
    return Value{j.get<double>()};
  }
  if (j.is_string()) {
    return Value{j.get<std::string>()};
  }
  throw std::invalid_argument(std::string("case variable must be a scalar, got ") + j.type_name());
}

nlohmann::json value_to_json(const Value& value) {
  switch (value.index()) {
    case 1:
      return *std::get_if<bool>(&value);
    case 2:
      return *std::get_if<std::int64_t>(&value);
    case 3:
      return *std::get_if<double>(&value);
    case 4:
      return *std::get_if<std::string>(&value);
    default:
      return nullptr;
  }
}

VariableEnvironment case_variables_from_json(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw std::invalid_argument(std::string("case variables must be a JSON object, got ") +
                                j.type_name());
  }

  VariableEnvironment variables;
  for (const auto& item : j.items()) {
    try {
      variables.emplace(item.key(), value_from_json(item.value()));
    } catch (const std::invalid_argument& e) {
      throw std::invalid_argument("variable '" + item.key() + "': " + e.what());
    }
  }
  return variables;
}

nlohmann::json case_variables_to_json(const VariableEnvironment& variables) {
  nlohmann::json j = nlohmann::json::object();
  for (const auto& [name, value] : variables) {
    j[name] = value_to_json(value);
  }
  return j;
}

std::string case_variables_hash(const VariableEnvironment& variables) {
  return core::sha256_hex(case_variables_to_json(variables).dump());
}

}  // namespace lexrisk::expression
