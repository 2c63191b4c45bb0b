#include "lexrisk/engine/legal_analysis.h"

#include <catch2/catch.hpp>

#include <string>

using namespace lexrisk;
using namespace lexrisk::engine;

namespace {

LegalRisk risk_with(const std::string& rule_id, rules::Severity severity,
                    std::vector<std::string> articles) {
  LegalRisk risk;
  risk.rule_id = rule_id;
  risk.risk_type = "tipo_" + rule_id;
  risk.severity = severity;
  risk.confidence = rules::Confidence::kHigh;
  risk.legal_articles = std::move(articles);
  risk.evidence_status = rules::EvidenceStatus::kSufficient;
  return risk;
}

}  // namespace

TEST_CASE("No risks is a confident outcome", "[analysis]") {
  const auto analysis = build_result("case-0", {});

  CHECK(analysis.case_id == "case-0");
  CHECK(analysis.legal_risks.empty());
  CHECK(analysis.confidence_level == rules::Confidence::kHigh);
  CHECK(analysis.legal_conclusion == kNoRisksConclusion);
  CHECK(analysis.legal_basis.empty());
  CHECK(analysis.missing_data.empty());
}

TEST_CASE("Overall confidence follows the weakest risk", "[analysis]") {
  SECTION("high and low severities yield medium") {
    const auto analysis =
        build_result("case-1", {risk_with("R1", rules::Severity::kHigh, {"Art. 5 TRLC"}),
                                risk_with("R2", rules::Severity::kLow, {"Art. 444 TRLC"})});
    CHECK(analysis.confidence_level == rules::Confidence::kMedium);
  }

  SECTION("an indeterminate risk forces indeterminate") {
    const auto analysis =
        build_result("case-1", {risk_with("R1", rules::Severity::kHigh, {"Art. 5 TRLC"}),
                                risk_with("R2", rules::Severity::kLow, {}),
                                risk_with("R3", rules::Severity::kIndeterminate, {})});
    CHECK(analysis.confidence_level == rules::Confidence::kIndeterminate);
  }

  SECTION("only low severities yield low") {
    const auto analysis = build_result("case-1", {risk_with("R1", rules::Severity::kLow, {})});
    CHECK(analysis.confidence_level == rules::Confidence::kLow);
  }
}

TEST_CASE("Conclusion names the risk count and leading articles", "[analysis]") {
  auto first = risk_with("R1", rules::Severity::kHigh, {"Art. 226 TRLC", "Art. 5 TRLC"});
  first.missing_data = {"Aportar balance"};
  auto second = risk_with(
      "R2", rules::Severity::kMedium,
      {"Art. 5 TRLC", "Art. 2 TRLC", "Art. 443 TRLC", "Art. 444 TRLC", "Art. 442 TRLC"});
  second.missing_data = {"Aportar auditoría"};

  const auto analysis = build_result("case-2", {first, second});

  CHECK(analysis.legal_risks.size() == 2);
  CHECK(analysis.legal_basis ==
        std::vector<std::string>{"Art. 2 TRLC", "Art. 5 TRLC", "Art. 226 TRLC", "Art. 442 TRLC",
                                 "Art. 443 TRLC", "Art. 444 TRLC"});
  CHECK(analysis.missing_data == std::vector<std::string>{"Aportar balance", "Aportar auditoría"});
  CHECK(analysis.legal_conclusion ==
        "Se detectaron 2 riesgo(s) legal(es). Artículos relevantes: Art. 2 TRLC, Art. 5 TRLC, "
        "Art. 226 TRLC, Art. 442 TRLC, Art. 443 TRLC");

  const auto j = legal_analysis_to_json(analysis);
  CHECK(j.at("confidence_level") == "media");
  CHECK(j.at("legal_risks").size() == 2);
  CHECK(j.at("legal_risks").at(0).at("rule_id") == "R1");
}

TEST_CASE("Legal basis ordering", "[analysis]") {
  CHECK(sort_legal_basis({"Art. 10", "Art. 9", "Art. 9", "Disposición final", "Art. 100"}) ==
        std::vector<std::string>{"Art. 9", "Art. 10", "Art. 100", "Disposición final"});
}

TEST_CASE("Legal risk JSON round trip", "[analysis]") {
  auto risk = risk_with("R1", rules::Severity::kCritical, {"Art. 5 TRLC"});
  risk.discarded_articles = {"Art. 6 TRLC"};
  risk.confidence = rules::Confidence::kIndeterminate;
  risk.evidence_status = rules::EvidenceStatus::kInsufficient;

  const auto j = legal_risk_to_json(risk);
  CHECK(j.at("severity") == "critica");
  CHECK(j.at("evidence_status") == "insuficiente");

  const auto restored = legal_risk_from_json(j);
  CHECK(restored.severity == risk.severity);
  CHECK(restored.confidence == risk.confidence);
  CHECK(restored.discarded_articles == risk.discarded_articles);
  CHECK(legal_risk_to_json(restored) == j);
}
