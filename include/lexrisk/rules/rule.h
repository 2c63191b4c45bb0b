#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace lexrisk::rules {

// Activation condition of a rule. Every identifier read by `condition` is expected to be listed
// in variables_required; lint_rulebook() reports the ones that are not.
struct Trigger {
  std::string condition;                   // NOLINT(readability-identifier-naming)
  std::set<std::string> variables_required;  // NOLINT(readability-identifier-naming)
};

// Advisory description of the documents that support a rule. Never evaluated.
struct EvidenceRequired {
  std::vector<std::string> document_types;  // NOLINT(readability-identifier-naming)
  std::vector<std::string> descriptions;    // NOLINT(readability-identifier-naming)
};

// Severity ladder, scanned critical -> low. Absent levels are skipped.
struct SeverityLogic {
  std::optional<std::string> critical;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> high;      // NOLINT(readability-identifier-naming)
  std::optional<std::string> medium;    // NOLINT(readability-identifier-naming)
  std::optional<std::string> low;       // NOLINT(readability-identifier-naming)
};

// Confidence ladder, scanned high -> indeterminate. Absent levels are skipped.
struct ConfidenceLogic {
  std::optional<std::string> high;           // NOLINT(readability-identifier-naming)
  std::optional<std::string> medium;         // NOLINT(readability-identifier-naming)
  std::optional<std::string> low;            // NOLINT(readability-identifier-naming)
  std::optional<std::string> indeterminate;  // NOLINT(readability-identifier-naming)
};

// Text templates with {variable} placeholders, rendered against the case environment.
struct Outputs {
  std::string description_template;                  // NOLINT(readability-identifier-naming)
  std::string recommendation_template;               // NOLINT(readability-identifier-naming)
  std::optional<std::string> missing_data_template;  // rendered only when evidence is lacking
};

// One codified legal rule. Immutable once loaded.
struct Rule {
  std::string rule_id;                    // unique within a rulebook
  std::string risk_type;                  // NOLINT(readability-identifier-naming)
  std::vector<std::string> article_refs;  // citations as written, e.g. "Art. 5 TRLC"
  Trigger trigger;                        // NOLINT(readability-identifier-naming)
  EvidenceRequired evidence_required;     // NOLINT(readability-identifier-naming)
  SeverityLogic severity_logic;           // NOLINT(readability-identifier-naming)
  ConfidenceLogic confidence_logic;       // NOLINT(readability-identifier-naming)
  Outputs outputs;                        // NOLINT(readability-identifier-naming)
};

// Rulebook is a read-only value passed explicitly into every evaluation.
// Rule order is the order of the source document and is preserved.
struct Rulebook {
  nlohmann::json metadata = nlohmann::json::object();  // NOLINT(readability-identifier-naming)
  std::vector<Rule> rules;                             // NOLINT(readability-identifier-naming)

  // metadata.version when it is a string; nullopt otherwise.
  [[nodiscard]] std::optional<std::string> version() const {
    const auto it = metadata.find("version");
    if (it == metadata.end() || !it->is_string()) {
      return std::nullopt;
    }
    return it->get<std::string>();
  }
};

}  // namespace lexrisk::rules
