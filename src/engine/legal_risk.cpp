#include "lexrisk/engine/legal_risk.h"

#include <stdexcept>

namespace lexrisk::engine {

nlohmann::json legal_risk_to_json(const LegalRisk& risk) {
  nlohmann::json j;
  j["confidence"] = rules::to_string(risk.confidence);
  j["description"] = risk.description;
  j["discarded_articles"] = risk.discarded_articles;
  j["evidence_status"] = rules::to_string(risk.evidence_status);
  j["jurisprudence"] = risk.jurisprudence;
  j["legal_articles"] = risk.legal_articles;
  j["missing_data"] = risk.missing_data;
  j["recommendation"] = risk.recommendation;
  j["risk_type"] = risk.risk_type;
  j["rule_id"] = risk.rule_id;
  j["severity"] = rules::to_string(risk.severity);
  return j;
}

LegalRisk legal_risk_from_json(const nlohmann::json& j) {
  LegalRisk risk;
  risk.rule_id = j.at("rule_id").get<std::string>();
  risk.risk_type = j.at("risk_type").get<std::string>();
  risk.description = j.at("description").get<std::string>();
  risk.recommendation = j.at("recommendation").get<std::string>();
  risk.legal_articles = j.at("legal_articles").get<std::vector<std::string>>();
  risk.discarded_articles = j.at("discarded_articles").get<std::vector<std::string>>();
  risk.jurisprudence = j.at("jurisprudence").get<std::vector<std::string>>();
  risk.missing_data = j.at("missing_data").get<std::vector<std::string>>();

  const auto severity = rules::severity_from_string(j.at("severity").get<std::string>());
  const auto confidence = rules::confidence_from_string(j.at("confidence").get<std::string>());
  const auto evidence =
      rules::evidence_status_from_string(j.at("evidence_status").get<std::string>());
  if (!severity || !confidence || !evidence) {
    throw std::invalid_argument("legal risk '" + risk.rule_id + "' has an unknown level term");
  }
  risk.severity = *severity;
  risk.confidence = *confidence;
  risk.evidence_status = *evidence;
  return risk;
}

}  // namespace lexrisk::engine
