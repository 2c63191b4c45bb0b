#pragma once

#include "lexrisk/engine/legal_risk.h"
#include "lexrisk/rules/levels.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace lexrisk::engine {

// Conclusion used when no rule produced a risk.
constexpr const char* kNoRisksConclusion =
    "No se detectaron riesgos legales específicos según las reglas evaluadas.";

// Maximum number of articles quoted in the conclusion paragraph.
constexpr std::size_t kMaxConclusionArticles = 5;

// LegalAnalysis is the case-level aggregate over all findings.
struct LegalAnalysis {
  std::string case_id;                     // NOLINT(readability-identifier-naming)
  std::vector<LegalRisk> legal_risks;      // rulebook order
  std::string legal_conclusion;            // NOLINT(readability-identifier-naming)
  rules::Confidence confidence_level{rules::Confidence::kHigh};
  std::vector<std::string> missing_data;   // every risk's notes, in risk order
  std::vector<std::string> legal_basis;    // unique cited articles, by article number then text
};

// build_result aggregates findings into a LegalAnalysis.
//
// Zero risks: confidence kHigh ("alta") and kNoRisksConclusion; absence of risk is a reportable
// outcome, not a failure. Otherwise the overall confidence is the weakest link:
//   - any risk with indeterminate severity      -> kIndeterminate
//   - else any critical, high or medium severity -> kMedium
//   - else                                        -> kLow
[[nodiscard]] LegalAnalysis build_result(const std::string& case_id,
                                         const std::vector<LegalRisk>& risks);

// sort_legal_basis de-duplicates citations and orders them by article number (citations without
// a number last), then by text.
[[nodiscard]] std::vector<std::string> sort_legal_basis(std::vector<std::string> articles);

[[nodiscard]] nlohmann::json legal_analysis_to_json(const LegalAnalysis& analysis);

}  // namespace lexrisk::engine
