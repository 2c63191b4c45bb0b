#include "lexrisk/rules/escalation.h"

#include <catch2/catch.hpp>

using namespace lexrisk;
using namespace lexrisk::rules;

TEST_CASE("Severity ladder is scanned top-down", "[escalation]") {
  const expression::VariableEnvironment vars = {
      {"meses", expression::Value{std::int64_t{14}}},
  };
  const expression::ExpressionEvaluator evaluator(vars);

  SECTION("first true level wins when several match") {
    SeverityLogic logic;
    logic.critical = "meses > 12";
    logic.high = "meses > 2";
    logic.low = "true";
    CHECK(resolve_severity(logic, evaluator) == Severity::kCritical);
  }

  SECTION("lower level applies when higher ones are false or absent") {
    SeverityLogic logic;
    logic.critical = "meses > 24";
    logic.medium = "meses > 6";
    CHECK(resolve_severity(logic, evaluator) == Severity::kMedium);
  }

  SECTION("null and malformed levels are skipped") {
    SeverityLogic logic;
    logic.critical = "ausente > 1";
    logic.high = "meses = 14";
    logic.low = "meses > 0";
    CHECK(resolve_severity(logic, evaluator) == Severity::kLow);
  }

  SECTION("non-boolean levels match by truthiness") {
    SeverityLogic logic;
    logic.high = "meses";
    CHECK(resolve_severity(logic, evaluator) == Severity::kHigh);

    SeverityLogic zero;
    zero.high = "MIN(meses, 0)";
    zero.low = "meses > 0";
    CHECK(resolve_severity(zero, evaluator) == Severity::kLow);
  }

  SECTION("no match yields indeterminate") {
    CHECK(resolve_severity(SeverityLogic{}, evaluator) == Severity::kIndeterminate);
  }
}

TEST_CASE("Confidence ladder is scanned top-down", "[escalation]") {
  const expression::VariableEnvironment vars = {
      {"documentos", expression::Value{std::int64_t{1}}},
  };
  const expression::ExpressionEvaluator evaluator(vars);

  ConfidenceLogic logic;
  logic.high = "documentos >= 3";
  logic.medium = "documentos >= 1";
  logic.low = "true";
  CHECK(resolve_confidence(logic, evaluator) == Confidence::kMedium);

  ConfidenceLogic unmatched;
  unmatched.high = "documentos >= 3";
  CHECK(resolve_confidence(unmatched, evaluator) == Confidence::kIndeterminate);
}

TEST_CASE("Levels use localized terms", "[escalation][levels]") {
  CHECK(to_string(Severity::kCritical) == "critica");
  CHECK(to_string(Severity::kIndeterminate) == "indeterminado");
  CHECK(to_string(Confidence::kHigh) == "alta");
  CHECK(to_string(Confidence::kLow) == "baja");
  CHECK(to_string(EvidenceStatus::kMissing) == "falta");
  CHECK(to_string(EvidenceStatus::kInsufficient) == "insuficiente");
  CHECK(to_string(RuleState::kNotEvaluable) == "not_evaluable");

  CHECK(severity_from_string("media") == Severity::kMedium);
  CHECK(confidence_from_string("indeterminado") == Confidence::kIndeterminate);
  CHECK(evidence_status_from_string("suficiente") == EvidenceStatus::kSufficient);
  CHECK(rule_state_from_string("errored") == RuleState::kErrored);
  CHECK_FALSE(severity_from_string("medium").has_value());
}
