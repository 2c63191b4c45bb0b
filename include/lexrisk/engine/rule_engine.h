#pragma once

#include "lexrisk/citation/article_allowlist.h"
#include "lexrisk/core/clock.h"
#include "lexrisk/engine/legal_analysis.h"
#include "lexrisk/engine/legal_risk.h"
#include "lexrisk/engine/rule_engine_result.h"
#include "lexrisk/engine/rule_outcome.h"
#include "lexrisk/expression/value.h"
#include "lexrisk/rules/rule.h"

#include <string>
#include <vector>

namespace lexrisk::engine {

// Both views of one evaluation pass.
struct CaseAnalysis {
  RuleEngineResult result;  // NOLINT(readability-identifier-naming)
  LegalAnalysis analysis;   // NOLINT(readability-identifier-naming)
};

// RuleEngine evaluates a rulebook against case variables.
//
// Per rule:
//   1. a required variable is absent              -> NotEvaluable
//   2. trigger is not exactly boolean true        -> Discarded
//   3. severity and confidence from their ladders
//   4. article_refs filtered through the allow-list; any discard forces indeterminate confidence
//   5. evidence_status: falta when every declared article was discarded, insuficiente when some
//      were or confidence is indeterminate, suficiente otherwise
//   6. description, recommendation and missing-data notes rendered from the rule's templates
// Any exception inside steps 1-6 yields Errored for that rule only.
//
// The engine keeps a reference to the rulebook, which must outlive it. The allow-list is
// computed once at construction. All evaluation methods are const and allocate a fresh
// evaluator per rule, so one engine may serve concurrent callers.
class RuleEngine {
 public:
  RuleEngine(const rules::Rulebook& rulebook, std::string legal_context);
  RuleEngine(rules::Rulebook&&, std::string) = delete;

  [[nodiscard]] RuleOutcome evaluate_rule(const rules::Rule& rule,
                                          const expression::VariableEnvironment& variables) const;

  // Findings of every triggered rule, in rulebook order.
  [[nodiscard]] std::vector<LegalRisk> evaluate_rules(
      const expression::VariableEnvironment& variables) const;

  // Full deterministic result. The clock only feeds evaluated_at and execution_time_ms.
  [[nodiscard]] RuleEngineResult evaluate(const std::string& case_id,
                                          const expression::VariableEnvironment& variables,
                                          const core::IClock& clock) const;
  [[nodiscard]] RuleEngineResult evaluate(const std::string& case_id,
                                          const expression::VariableEnvironment& variables) const;

  // One pass producing both the RuleEngineResult and the aggregate LegalAnalysis.
  [[nodiscard]] CaseAnalysis analyze(const std::string& case_id,
                                     const expression::VariableEnvironment& variables,
                                     const core::IClock& clock) const;
  [[nodiscard]] CaseAnalysis analyze(const std::string& case_id,
                                     const expression::VariableEnvironment& variables) const;

  [[nodiscard]] const citation::ArticleSet& allowed_articles() const noexcept {
    return allowed_articles_;
  }
  [[nodiscard]] const std::string& legal_context() const noexcept { return legal_context_; }
  [[nodiscard]] const rules::Rulebook& rulebook() const noexcept { return rulebook_; }

 private:
  [[nodiscard]] LegalRisk build_risk(const rules::Rule& rule,
                                     const expression::VariableEnvironment& variables) const;

  // Shared pass behind evaluate() and analyze(); appends triggered findings to `risks`.
  [[nodiscard]] RuleEngineResult run(const std::string& case_id,
                                     const expression::VariableEnvironment& variables,
                                     const core::IClock& clock,
                                     std::vector<LegalRisk>& risks) const;

  const rules::Rulebook& rulebook_;
  std::string legal_context_;
  citation::ArticleSet allowed_articles_;
};

// Convenience: a one-shot engine over the given legal context.
[[nodiscard]] std::vector<LegalRisk> evaluate_rules(const rules::Rulebook& rulebook,
                                                    const expression::VariableEnvironment& variables,
                                                    const std::string& legal_context);

// Note appended to missing_data for each citation removed by the allow-list.
[[nodiscard]] std::string discarded_citation_note(const std::string& citation);

}  // namespace lexrisk::engine
