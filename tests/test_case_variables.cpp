#include "lexrisk/expression/case_variables.h"

#include <catch2/catch.hpp>

#include <stdexcept>

using namespace lexrisk::expression;

TEST_CASE("Case variables are read from a JSON object", "[expression][case_variables]") {
  const auto j = nlohmann::json::parse(R"({
    "meses": 3,
    "ratio": 0.75,
    "doble_contabilidad": true,
    "estado": "concurso",
    "importe": null
  })");

  const auto vars = case_variables_from_json(j);
  REQUIRE(vars.size() == 5);
  CHECK(std::get<std::int64_t>(vars.at("meses")) == 3);
  CHECK(std::get<double>(vars.at("ratio")) == 0.75);
  CHECK(std::get<bool>(vars.at("doble_contabilidad")));
  CHECK(std::get<std::string>(vars.at("estado")) == "concurso");
  CHECK(is_null(vars.at("importe")));
}

TEST_CASE("Non-scalar case variables are rejected", "[expression][case_variables]") {
  CHECK_THROWS_AS(case_variables_from_json(nlohmann::json::array()), std::invalid_argument);
  CHECK_THROWS_AS(case_variables_from_json(nlohmann::json::parse(R"({"a": [1, 2]})")),
                  std::invalid_argument);
  CHECK_THROWS_AS(case_variables_from_json(nlohmann::json::parse(R"({"a": {"b": 1}})")),
                  std::invalid_argument);
}

TEST_CASE("Case variables hash is content addressed", "[expression][case_variables]") {
  const auto first = case_variables_from_json(nlohmann::json::parse(R"({"a": 1, "b": "x"})"));
  const auto reordered =
      case_variables_from_json(nlohmann::json::parse(R"({"b": "x", "a": 1})"));
  const auto changed = case_variables_from_json(nlohmann::json::parse(R"({"a": 2, "b": "x"})"));

  const auto hash = case_variables_hash(first);
  CHECK(hash.size() == 64);
  CHECK(hash == case_variables_hash(reordered));
  CHECK(hash != case_variables_hash(changed));
}

TEST_CASE("Case variables serialize back to JSON", "[expression][case_variables]") {
  const VariableEnvironment vars = {
      {"meses", Value{std::int64_t{3}}},
      {"importe", Value{}},
  };
  const auto j = case_variables_to_json(vars);
  CHECK(j.at("meses") == 3);
  CHECK(j.at("importe").is_null());
}
