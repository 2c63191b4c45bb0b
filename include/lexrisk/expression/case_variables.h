#pragma once

#include "lexrisk/expression/value.h"

#include <nlohmann/json.hpp>

#include <string>

namespace lexrisk::expression {

// value_from_json maps a JSON scalar to a Value. Integers that fit int64 stay integers;
// unsigned values above INT64_MAX and all floats become decimals.
// Throws std::invalid_argument for arrays and objects.
[[nodiscard]] Value value_from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json value_to_json(const Value& value);

// case_variables_from_json reads a flat JSON object of scalars.
// Throws std::invalid_argument if j is not an object or any member is not a scalar.
[[nodiscard]] VariableEnvironment case_variables_from_json(const nlohmann::json& j);

// Keys come out sorted (std::map ordering on both sides).
[[nodiscard]] nlohmann::json case_variables_to_json(const VariableEnvironment& variables);

// case_variables_hash: SHA-256 (hex) of the compact JSON dump of the environment.
// Two environments hash equal iff they serialize identically.
[[nodiscard]] std::string case_variables_hash(const VariableEnvironment& variables);

}  // namespace lexrisk::expression
