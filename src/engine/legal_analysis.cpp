#include "lexrisk/engine/legal_analysis.h"

#include "lexrisk/citation/article_allowlist.h"

#include <algorithm>
#include <optional>
#include <tuple>

namespace lexrisk::engine {

namespace {

// Numbers carry no leading zeros, so (length, text) orders them numerically without parsing.
struct ArticleKey {
  bool has_number{false};
  std::size_t digits{0};
  std::string number;
  std::string text;
};

ArticleKey key_of(const std::string& article) {
  ArticleKey key;
  key.text = article;
  if (auto number = citation::normalize_article_reference(article)) {
    key.has_number = true;
    key.digits = number->size();
    key.number = std::move(*number);
  }
  return key;
}

bool key_less(const ArticleKey& a, const ArticleKey& b) {
  return std::forward_as_tuple(!a.has_number, a.digits, a.number, a.text) <
         std::forward_as_tuple(!b.has_number, b.digits, b.number, b.text);
}

rules::Confidence overall_confidence(const std::vector<LegalRisk>& risks) {
  const auto has = [&risks](auto predicate) {
    return std::any_of(risks.begin(), risks.end(), predicate);
  };
  if (has([](const LegalRisk& r) { return r.severity == rules::Severity::kIndeterminate; })) {
    return rules::Confidence::kIndeterminate;
  }
  if (has([](const LegalRisk& r) { return r.severity >= rules::Severity::kMedium; })) {
    return rules::Confidence::kMedium;
  }
  return rules::Confidence::kLow;
}

}  // namespace

std::vector<std::string> sort_legal_basis(std::vector<std::string> articles) {
  std::vector<ArticleKey> keys;
  keys.reserve(articles.size());
  for (const auto& article : articles) {
    keys.push_back(key_of(article));
  }
  std::sort(keys.begin(), keys.end(), key_less);

  std::vector<std::string> sorted;
  sorted.reserve(keys.size());
  for (auto& key : keys) {
    if (sorted.empty() || sorted.back() != key.text) {
      sorted.push_back(std::move(key.text));
    }
  }
  return sorted;
}

LegalAnalysis build_result(const std::string& case_id, const std::vector<LegalRisk>& risks) {
  LegalAnalysis analysis;
  analysis.case_id = case_id;

  if (risks.empty()) {
    analysis.legal_conclusion = kNoRisksConclusion;
    analysis.confidence_level = rules::Confidence::kHigh;
    return analysis;
  }

  analysis.legal_risks = risks;

  std::vector<std::string> cited;
  for (const auto& risk : risks) {
    cited.insert(cited.end(), risk.legal_articles.begin(), risk.legal_articles.end());
    analysis.missing_data.insert(analysis.missing_data.end(), risk.missing_data.begin(),
                                 risk.missing_data.end());
  }
  analysis.legal_basis = sort_legal_basis(std::move(cited));
  analysis.confidence_level = overall_confidence(risks);

  std::string conclusion =
      "Se detectaron " + std::to_string(risks.size()) + " riesgo(s) legal(es).";
  if (!analysis.legal_basis.empty()) {
    conclusion += " Artículos relevantes: ";
    const std::size_t shown = std::min(analysis.legal_basis.size(), kMaxConclusionArticles);
    for (std::size_t i = 0; i < shown; ++i) {
      if (i > 0) {
        conclusion += ", ";
      }
      conclusion += analysis.legal_basis[i];
    }
  }
  analysis.legal_conclusion = std::move(conclusion);
  return analysis;
}

nlohmann::json legal_analysis_to_json(const LegalAnalysis& analysis) {
  nlohmann::json risks = nlohmann::json::array();
  for (const auto& risk : analysis.legal_risks) {
    risks.push_back(legal_risk_to_json(risk));
  }

  nlohmann::json j;
  j["case_id"] = analysis.case_id;
  j["confidence_level"] = rules::to_string(analysis.confidence_level);
  j["legal_basis"] = analysis.legal_basis;
  j["legal_conclusion"] = analysis.legal_conclusion;
  j["legal_risks"] = std::move(risks);
  j["missing_data"] = analysis.missing_data;
  return j;
}

}  // namespace lexrisk::engine
