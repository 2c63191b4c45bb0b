#include "lexrisk/engine/rule_engine.h"

#include "lexrisk/core/clock.h"
#include "lexrisk/rules/rulebook_loader.h"

#include <catch2/catch.hpp>

#include <algorithm>
#include <string>
#include <type_traits>

using namespace lexrisk;
using namespace lexrisk::engine;

namespace {

using expression::Value;
using expression::VariableEnvironment;

constexpr const char* kEngineRulebook = R"({
  "metadata": {"version": "engine-test"},
  "rules": [
    {
      "rule_id": "R_DEBER_SOLICITUD",
      "risk_type": "deber_solicitud",
      "article_refs": ["Art. 5 TRLC"],
      "trigger": {
        "condition": "insolvencia_actual == true AND meses > 2",
        "variables_required": ["insolvencia_actual", "meses"]
      },
      "evidence_required": {"document_types": ["balance"]},
      "severity_logic": {"critical": "meses > 12", "high": "meses > 2"},
      "confidence_logic": {"high": "meses > 2"},
      "outputs": {
        "description_template": "Insolvencia desde hace {meses} meses",
        "recommendation_template": "Solicitar concurso",
        "missing_data_template": "Aportar balance de {ejercicio}"
      }
    },
    {
      "rule_id": "R_CUENTAS",
      "risk_type": "cuentas_no_depositadas",
      "article_refs": ["Art. 444 TRLC", "Art. 445 TRLC"],
      "trigger": {"condition": "ejercicios >= 1", "variables_required": ["ejercicios"]},
      "evidence_required": {},
      "severity_logic": {"low": "ejercicios >= 1"},
      "confidence_logic": {"high": "ejercicios >= 1"},
      "outputs": {
        "description_template": "{ejercicios} ejercicio(s) sin depositar",
        "recommendation_template": "Depositar cuentas"
      }
    }
  ]
})";

constexpr const char* kContextWithArticle5 =
    "El Art. 5 TRLC establece el deber de solicitar la declaración de concurso.";

VariableEnvironment insolvent_for(std::int64_t months) {
  return {
      {"insolvencia_actual", Value{true}},
      {"meses", Value{months}},
  };
}

int rank(rules::Confidence confidence) { return static_cast<int>(confidence); }

}  // namespace

static_assert(std::is_constructible_v<RuleEngine, const rules::Rulebook&, std::string>);
static_assert(!std::is_constructible_v<RuleEngine, rules::Rulebook&&, std::string>,
              "an engine must not bind to a temporary rulebook");

TEST_CASE("Triggered rule with verified citation", "[engine]") {
  const auto rulebook = rules::parse_rulebook(kEngineRulebook);
  const RuleEngine engine(rulebook, kContextWithArticle5);

  const auto risks = engine.evaluate_rules(insolvent_for(4));

  REQUIRE(risks.size() == 1);
  const auto& risk = risks[0];
  CHECK(risk.rule_id == "R_DEBER_SOLICITUD");
  CHECK(risk.risk_type == "deber_solicitud");
  CHECK(risk.severity == rules::Severity::kHigh);
  CHECK(risk.confidence == rules::Confidence::kHigh);
  CHECK(risk.evidence_status == rules::EvidenceStatus::kSufficient);
  CHECK(risk.legal_articles == std::vector<std::string>{"Art. 5 TRLC"});
  CHECK(risk.discarded_articles.empty());
  CHECK(risk.description == "Insolvencia desde hace 4 meses");
  CHECK(risk.recommendation == "Solicitar concurso");
  CHECK(risk.missing_data.empty());
  CHECK(risk.jurisprudence.empty());
}

TEST_CASE("Citation absent from the legal context is discarded", "[engine][citation]") {
  const auto rulebook = rules::parse_rulebook(kEngineRulebook);
  const RuleEngine engine(rulebook, "Texto sin referencias.");

  const auto risks = engine.evaluate_rules(insolvent_for(4));

  REQUIRE(risks.size() == 1);
  const auto& risk = risks[0];
  CHECK(risk.legal_articles.empty());
  CHECK(risk.discarded_articles == std::vector<std::string>{"Art. 5 TRLC"});
  CHECK(risk.confidence == rules::Confidence::kIndeterminate);
  CHECK(risk.evidence_status == rules::EvidenceStatus::kMissing);
  REQUIRE(risk.missing_data.size() == 2);
  CHECK(risk.missing_data[0] == "Aportar balance de [unavailable]");
  CHECK(risk.missing_data[1] == discarded_citation_note("Art. 5 TRLC"));
}

TEST_CASE("Rules with missing variables are not evaluable", "[engine]") {
  const auto rulebook = rules::parse_rulebook(kEngineRulebook);
  const RuleEngine engine(rulebook, kContextWithArticle5);
  const core::FixedClock clock("2026-01-01T00:00:00Z");

  const auto analysis = engine.analyze("case-empty", VariableEnvironment{}, clock);

  const auto& result = analysis.result;
  CHECK(result.evaluated_rules.empty());
  CHECK(result.triggered_rules.empty());
  CHECK(result.discarded_rules.empty());
  CHECK(result.not_evaluable_rules ==
        std::vector<std::string>{"R_DEBER_SOLICITUD", "R_CUENTAS"});
  CHECK(result.summary_flags.at(kFlagHasNotEvaluableRules));
  CHECK_FALSE(result.summary_flags.at(kFlagHasTriggeredRules));

  CHECK(analysis.analysis.legal_risks.empty());
  CHECK(analysis.analysis.confidence_level == rules::Confidence::kHigh);
  CHECK(analysis.analysis.legal_conclusion == kNoRisksConclusion);
}

TEST_CASE("Evaluate rule reports each outcome", "[engine]") {
  const auto rulebook = rules::parse_rulebook(kEngineRulebook);
  const RuleEngine engine(rulebook, kContextWithArticle5);
  const auto& deber = rulebook.rules[0];

  SECTION("missing variables are listed") {
    const VariableEnvironment vars = {{"insolvencia_actual", Value{true}}};
    const auto outcome = engine.evaluate_rule(deber, vars);
    REQUIRE(std::holds_alternative<NotEvaluable>(outcome));
    CHECK(std::get<NotEvaluable>(outcome).missing_variables == std::vector<std::string>{"meses"});
  }

  SECTION("false trigger is discarded") {
    const auto outcome = engine.evaluate_rule(deber, insolvent_for(1));
    REQUIRE(std::holds_alternative<Discarded>(outcome));
    CHECK(std::get<Discarded>(outcome).trigger_result == false);
  }

  SECTION("null trigger is discarded without a result") {
    const VariableEnvironment vars = {
        {"insolvencia_actual", Value{true}},
        {"meses", Value{}},
    };
    const auto outcome = engine.evaluate_rule(deber, vars);
    REQUIRE(std::holds_alternative<Discarded>(outcome));
    CHECK_FALSE(std::get<Discarded>(outcome).trigger_result.has_value());
  }

  SECTION("true trigger produces a risk") {
    const auto outcome = engine.evaluate_rule(deber, insolvent_for(14));
    REQUIRE(std::holds_alternative<Triggered>(outcome));
    CHECK(std::get<Triggered>(outcome).risk.severity == rules::Severity::kCritical);
  }

  SECTION("non-boolean trigger fires by truthiness") {
    auto numeric = deber;
    numeric.trigger.condition = "meses";

    const auto fired = engine.evaluate_rule(numeric, insolvent_for(5));
    REQUIRE(std::holds_alternative<Triggered>(fired));
    CHECK(std::get<Triggered>(fired).risk.severity == rules::Severity::kHigh);

    const auto zero = engine.evaluate_rule(numeric, insolvent_for(0));
    REQUIRE(std::holds_alternative<Discarded>(zero));
    CHECK(std::get<Discarded>(zero).trigger_result == false);
  }
}

TEST_CASE("Result partitions triggered and discarded rules", "[engine][result]") {
  const auto rulebook = rules::parse_rulebook(kEngineRulebook);
  const RuleEngine engine(rulebook, kContextWithArticle5 + std::string(" Art. 444 y Art. 445."));
  const core::FixedClock clock("2026-01-01T00:00:00Z");

  VariableEnvironment vars = insolvent_for(1);
  vars["ejercicios"] = Value{std::int64_t{2}};
  const auto result = engine.evaluate("case-partition", vars, clock);

  CHECK(result.case_id == "case-partition");
  CHECK(result.rulebook_version == "engine-test");
  CHECK(result.evaluated_at == "2026-01-01T00:00:00Z");
  REQUIRE(result.evaluated_rules.size() == 2);
  REQUIRE(result.triggered_rules.size() == 1);
  REQUIRE(result.discarded_rules.size() == 1);
  CHECK(validate_partition(result));

  const auto& triggered = result.triggered_rules[0];
  CHECK(triggered.rule_id == "R_CUENTAS");
  CHECK(triggered.article == "Art. 444 TRLC");
  CHECK(triggered.state == rules::RuleState::kTriggered);
  CHECK(triggered.applies);
  CHECK(triggered.evidence_status == rules::EvidenceStatus::kSufficient);
  CHECK(triggered.evidence_found == std::vector<std::string>{"ejercicios"});
  CHECK(triggered.rationale.find("2 de 2") != std::string::npos);

  const auto& discarded = result.discarded_rules[0];
  CHECK(discarded.rule_id == "R_DEBER_SOLICITUD");
  CHECK(discarded.state == rules::RuleState::kDiscarded);
  CHECK_FALSE(discarded.applies);
  CHECK_FALSE(discarded.evidence_status.has_value());
  CHECK(discarded.severity == rules::Severity::kIndeterminate);
  CHECK(discarded.evidence_required == std::vector<std::string>{"balance"});
  CHECK(discarded.evidence_found == std::vector<std::string>{"insolvencia_actual", "meses"});
  CHECK(discarded.rationale.find("falsa") != std::string::npos);

  CHECK(result.summary_flags.at(kFlagHasTriggeredRules));
  CHECK_FALSE(result.summary_flags.at(kFlagHasCriticalRisk));
  CHECK_FALSE(result.summary_flags.at(kFlagHasDiscardedCitations));
  CHECK_FALSE(result.summary_flags.at(kFlagHasErroredRules));
}

TEST_CASE("A malformed trigger errors without stopping other rules", "[engine]") {
  auto rulebook = rules::parse_rulebook(kEngineRulebook);
  rulebook.rules[0].trigger.condition = "insolvencia_actual == = true";
  const RuleEngine engine(rulebook, "Art. 444 y Art. 445");
  const core::FixedClock clock("2026-01-01T00:00:00Z");

  VariableEnvironment vars = insolvent_for(4);
  vars["ejercicios"] = Value{std::int64_t{1}};
  const auto result = engine.evaluate("case-errored", vars, clock);

  REQUIRE(result.discarded_rules.size() == 1);
  CHECK(result.discarded_rules[0].state == rules::RuleState::kErrored);
  CHECK(result.discarded_rules[0].rationale.rfind("Error al evaluar la regla: ", 0) == 0);
  REQUIRE(result.triggered_rules.size() == 1);
  CHECK(result.triggered_rules[0].rule_id == "R_CUENTAS");
  CHECK(result.summary_flags.at(kFlagHasErroredRules));
  CHECK(validate_partition(result));
}

TEST_CASE("Removing a citation from the context never raises confidence", "[engine][citation]") {
  const auto rulebook = rules::parse_rulebook(kEngineRulebook);
  const VariableEnvironment vars = {{"ejercicios", Value{std::int64_t{3}}}};

  const RuleEngine full(rulebook, "Art. 444 TRLC y Art. 445 TRLC");
  const RuleEngine partial(rulebook, "Art. 444 TRLC");
  const RuleEngine empty(rulebook, "");

  const auto with_both = full.evaluate_rules(vars);
  const auto with_one = partial.evaluate_rules(vars);
  const auto with_none = empty.evaluate_rules(vars);
  REQUIRE(with_both.size() == 1);
  REQUIRE(with_one.size() == 1);
  REQUIRE(with_none.size() == 1);

  CHECK(with_both[0].confidence == rules::Confidence::kHigh);
  CHECK(with_both[0].evidence_status == rules::EvidenceStatus::kSufficient);
  CHECK(rank(with_one[0].confidence) <= rank(with_both[0].confidence));
  CHECK(rank(with_none[0].confidence) <= rank(with_one[0].confidence));

  CHECK(with_one[0].evidence_status == rules::EvidenceStatus::kInsufficient);
  CHECK(with_one[0].legal_articles == std::vector<std::string>{"Art. 444 TRLC"});
  CHECK(with_none[0].evidence_status == rules::EvidenceStatus::kMissing);
}

TEST_CASE("Risks with discarded citations never keep high confidence", "[engine][citation]") {
  const auto rulebook = rules::load_rulebook(LEXRISK_DEFAULT_RULEBOOK_PATH);
  const VariableEnvironment vars = {
      {"ratio_liquidez", Value{0.4}},
      {"deuda_vencida_impagada", Value{std::int64_t{250000}}},
      {"estados_financieros_auditados", Value{true}},
      {"insolvencia_actual", Value{true}},
      {"meses_desde_insolvencia", Value{std::int64_t{7}}},
      {"fecha_insolvencia_documentada", Value{true}},
      {"operaciones_vinculadas_2_anios", Value{std::int64_t{2}}},
      {"importe_operaciones_vinculadas", Value{60000.0}},
      {"contabilidad_irregular", Value{false}},
      {"doble_contabilidad", Value{true}},
      {"informe_auditoria_con_salvedades", Value{true}},
      {"cuentas_no_depositadas_ejercicios", Value{std::int64_t{0}}},
  };
  const std::string context = "Artículo 2. Artículo 5. Artículo 226. Artículo 443.";

  const RuleEngine engine(rulebook, context);
  const auto analysis = engine.analyze("case-bundled", vars, core::FixedClock("fixed"));

  CHECK(analysis.result.triggered_rules.size() == 4);
  CHECK(analysis.result.discarded_rules.size() == 1);
  CHECK(analysis.result.summary_flags.at(kFlagHasCriticalRisk));
  CHECK(analysis.result.summary_flags.at(kFlagHasDiscardedCitations));

  for (const auto& risk : analysis.analysis.legal_risks) {
    if (!risk.discarded_articles.empty()) {
      CHECK(risk.confidence == rules::Confidence::kIndeterminate);
      CHECK(risk.evidence_status != rules::EvidenceStatus::kSufficient);
    }
  }
  CHECK(analysis.analysis.confidence_level == rules::Confidence::kMedium);
  CHECK(analysis.analysis.legal_basis ==
        std::vector<std::string>{"Art. 2 TRLC", "Art. 5 TRLC", "Art. 226 TRLC", "Art. 443 TRLC"});
}

TEST_CASE("Evaluation is deterministic across clocks", "[engine][determinism]") {
  const auto rulebook = rules::parse_rulebook(kEngineRulebook);
  const RuleEngine engine(rulebook, kContextWithArticle5);
  VariableEnvironment vars = insolvent_for(14);
  vars["ejercicios"] = Value{std::int64_t{1}};

  const auto first = engine.evaluate("case-det", vars, core::FixedClock("2026-01-01T00:00:00Z"));
  const auto second = engine.evaluate("case-det", vars, core::FixedClock("2030-06-30T12:00:00Z"));

  CHECK(first.evaluated_at != second.evaluated_at);
  CHECK(deterministic_hash(first) == deterministic_hash(second));
  CHECK(rule_engine_result_to_json(first).at("triggered_rules") ==
        rule_engine_result_to_json(second).at("triggered_rules"));
  CHECK(first.summary_flags.at(kFlagHasCriticalRisk));

  const auto free_function = evaluate_rules(rulebook, vars, kContextWithArticle5);
  REQUIRE(free_function.size() == 2);
  CHECK(free_function[0].rule_id == "R_DEBER_SOLICITUD");
  CHECK(free_function[1].rule_id == "R_CUENTAS");
}
