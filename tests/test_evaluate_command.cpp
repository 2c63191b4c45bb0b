#include "lexrisk_cli/commands/evaluate_logic.h"

#include "lexrisk/core/clock.h"
#include "lexrisk/engine/rule_engine_result.h"
#include "lexrisk/rules/rulebook_loader.h"
#include "lexrisk/storage/result_store.h"

#include <catch2/catch.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

using namespace lexrisk;

namespace {

EvaluateInput art5_case() {
  EvaluateInput input;
  input.case_id = "case-cli";
  input.variables = {
      {"insolvencia_actual", expression::Value{true}},
      {"meses_desde_insolvencia", expression::Value{std::int64_t{8}}},
      {"fecha_insolvencia_documentada", expression::Value{true}},
  };
  input.legal_context = "Artículo 5. Deber de solicitar la declaración de concurso.";
  return input;
}

nlohmann::json run(const rules::Rulebook& rulebook, const EvaluateInput& input,
                   storage::IResultStore* store, const std::string& now, int expected_code) {
  std::ostringstream out;
  const core::FixedClock clock(now);
  const int code = execute_evaluate(rulebook, input, store, clock, out);
  REQUIRE(code == expected_code);
  if (expected_code != kEvaluateOk) {
    return nlohmann::json();
  }
  return nlohmann::json::parse(out.str());
}

}  // namespace

TEST_CASE("Evaluate prints analysis and result", "[cli][evaluate]") {
  const auto rulebook = rules::load_rulebook(LEXRISK_DEFAULT_RULEBOOK_PATH);

  const auto report = run(rulebook, art5_case(), nullptr, "2026-05-01T09:00:00Z", kEvaluateOk);

  CHECK_FALSE(report.at("replayed").get<bool>());
  CHECK(report.at("evaluation_key").get<std::string>().size() == 64);
  CHECK(report.at("result").at("case_id") == "case-cli");
  CHECK(report.at("result").at("rulebook_version") == "1.0.0");
  CHECK(report.at("result").at("evaluated_at") == "2026-05-01T09:00:00Z");

  const auto& triggered = report.at("result").at("triggered_rules");
  REQUIRE(triggered.size() == 1);
  CHECK(triggered.at(0).at("rule_id") == "TRLC_ART_5_DEBER_SOLICITUD");
  CHECK(triggered.at(0).at("severity") == "alta");
  CHECK(triggered.at(0).at("confidence") == "alta");

  const auto& not_evaluable = report.at("result").at("not_evaluable_rules");
  CHECK(not_evaluable.size() == 4);

  CHECK(report.at("analysis").at("legal_basis") == nlohmann::json::array({"Art. 5 TRLC"}));
  CHECK(report.at("analysis").at("confidence_level") == "media");
}

TEST_CASE("Evaluate stores then replays results", "[cli][evaluate]") {
  const auto rulebook = rules::load_rulebook(LEXRISK_DEFAULT_RULEBOOK_PATH);
  storage::InMemoryResultStore store;

  const auto first = run(rulebook, art5_case(), &store, "2026-05-01T09:00:00Z", kEvaluateOk);
  CHECK_FALSE(first.at("replayed").get<bool>());
  auto count = store.count();
  REQUIRE(count.has_value());
  CHECK(count.value() == 1);

  const auto second = run(rulebook, art5_case(), &store, "2026-06-01T09:00:00Z", kEvaluateOk);
  CHECK(second.at("replayed").get<bool>());
  CHECK(second.at("result_hash") == first.at("result_hash"));
  CHECK(second.at("result").at("evaluated_at") == "2026-05-01T09:00:00Z");
  CHECK(second.at("evaluation_key") == first.at("evaluation_key"));

  SECTION("different variables are a different evaluation") {
    auto changed = art5_case();
    changed.variables["meses_desde_insolvencia"] = expression::Value{std::int64_t{13}};
    const auto third = run(rulebook, changed, &store, "2026-06-01T09:00:00Z", kEvaluateOk);
    CHECK_FALSE(third.at("replayed").get<bool>());
    CHECK(third.at("evaluation_key") != first.at("evaluation_key"));
  }
}

TEST_CASE("Evaluate refuses to replay a diverging stored result", "[cli][evaluate]") {
  const auto rulebook = rules::load_rulebook(LEXRISK_DEFAULT_RULEBOOK_PATH);
  storage::InMemoryResultStore store;
  const auto input = art5_case();

  const auto key =
      storage::make_evaluation_key(input.case_id, rulebook, input.variables, input.legal_context);
  engine::RuleEngineResult stale;
  stale.case_id = input.case_id;
  stale.engine_version = "0.0.1";
  REQUIRE(store.put(key, stale).has_value());

  (void)run(rulebook, input, &store, "2026-05-01T09:00:00Z", kEvaluateReplayMismatch);
}
