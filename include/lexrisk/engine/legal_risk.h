#pragma once

#include "lexrisk/rules/levels.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace lexrisk::engine {

// LegalRisk is one finding produced by a triggered rule. Created only by RuleEngine.
//
// Invariant: discarded_articles non-empty => confidence == kIndeterminate.
struct LegalRisk {
  std::string rule_id;                          // NOLINT(readability-identifier-naming)
  std::string risk_type;                        // NOLINT(readability-identifier-naming)
  std::string description;                      // NOLINT(readability-identifier-naming)
  rules::Severity severity{rules::Severity::kIndeterminate};
  rules::Confidence confidence{rules::Confidence::kIndeterminate};
  std::vector<std::string> legal_articles;      // citations that passed the allow-list
  std::vector<std::string> discarded_articles;  // citations absent from the legal context
  std::vector<std::string> jurisprudence;       // NOLINT(readability-identifier-naming)
  rules::EvidenceStatus evidence_status{rules::EvidenceStatus::kMissing};
  std::string recommendation;                   // NOLINT(readability-identifier-naming)
  std::vector<std::string> missing_data;        // rendered template plus one note per discard
};

// Keys sorted; enums rendered with their localized terms.
[[nodiscard]] nlohmann::json legal_risk_to_json(const LegalRisk& risk);

// Throws nlohmann::json::exception on missing fields and std::invalid_argument on unknown terms.
[[nodiscard]] LegalRisk legal_risk_from_json(const nlohmann::json& j);

}  // namespace lexrisk::engine
