#pragma once

#include "lexrisk/core/clock.h"
#include "lexrisk/rules/levels.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lexrisk::engine {

// Summary flag names set by RuleEngine::evaluate().
constexpr const char* kFlagHasTriggeredRules = "has_triggered_rules";
constexpr const char* kFlagHasCriticalRisk = "has_critical_risk";
constexpr const char* kFlagHasDiscardedCitations = "has_discarded_citations";
constexpr const char* kFlagHasNotEvaluableRules = "has_not_evaluable_rules";
constexpr const char* kFlagHasErroredRules = "has_errored_rules";

// RuleDecision is the deterministic verdict for one evaluated rule.
// applies is true exactly when state == kTriggered.
struct RuleDecision {
  std::string rule_id;                      // NOLINT(readability-identifier-naming)
  std::string risk_type;                    // NOLINT(readability-identifier-naming)
  std::string article;                      // first citation declared by the rule, as written
  rules::RuleState state{rules::RuleState::kDiscarded};
  bool applies{false};                      // NOLINT(readability-identifier-naming)
  rules::Severity severity{rules::Severity::kIndeterminate};
  rules::Confidence confidence{rules::Confidence::kIndeterminate};
  std::vector<std::string> legal_articles;  // NOLINT(readability-identifier-naming)
  std::optional<rules::EvidenceStatus> evidence_status;  // set only for triggered rules
  std::vector<std::string> evidence_required;  // advisory document types from the rule
  std::vector<std::string> evidence_found;     // required variables present in the case, sorted
  std::string rationale;                       // short sentence built by logic, never a model
};

// RuleEngineResult is the official engine output. Built once by RuleEngineResultBuilder and
// never mutated afterwards.
//
// evaluated_rules holds every rule that reached a verdict (triggered, discarded or errored) in
// rulebook order; triggered_rules and discarded_rules partition it (errored counts as
// discarded). Rules that could not be evaluated are listed by id in not_evaluable_rules only.
struct RuleEngineResult {
  std::string case_id;                           // NOLINT(readability-identifier-naming)
  std::string engine_version;                    // NOLINT(readability-identifier-naming)
  std::optional<std::string> rulebook_version;   // NOLINT(readability-identifier-naming)
  std::vector<RuleDecision> evaluated_rules;     // NOLINT(readability-identifier-naming)
  std::vector<RuleDecision> triggered_rules;     // NOLINT(readability-identifier-naming)
  std::vector<RuleDecision> discarded_rules;     // NOLINT(readability-identifier-naming)
  std::vector<std::string> not_evaluable_rules;  // NOLINT(readability-identifier-naming)
  std::map<std::string, bool> summary_flags;     // NOLINT(readability-identifier-naming)
  std::string evaluated_at;                      // not hashed
  double execution_time_ms{0.0};                 // not hashed
};

// RuleEngineResultBuilder accumulates decisions and partitions them on build().
// The clock supplies evaluated_at and the elapsed time; it must outlive the builder.
class RuleEngineResultBuilder {
 public:
  RuleEngineResultBuilder(std::string case_id, std::optional<std::string> rulebook_version,
                          const core::IClock& clock);

  void add_decision(RuleDecision decision);
  void add_not_evaluable(std::string rule_id);
  void add_flag(const std::string& name, bool value);

  [[nodiscard]] RuleEngineResult build() const;

 private:
  std::string case_id_;
  std::optional<std::string> rulebook_version_;
  const core::IClock& clock_;
  std::int64_t started_micros_;
  std::vector<RuleDecision> decisions_;
  std::vector<std::string> not_evaluable_;
  std::map<std::string, bool> flags_;
};

[[nodiscard]] nlohmann::json rule_decision_to_json(const RuleDecision& decision);
[[nodiscard]] RuleDecision rule_decision_from_json(const nlohmann::json& j);

// Full serialization, including evaluated_at and execution_time_ms.
[[nodiscard]] nlohmann::json rule_engine_result_to_json(const RuleEngineResult& result);

// Throws nlohmann::json::exception on missing fields and std::invalid_argument on unknown terms.
[[nodiscard]] RuleEngineResult rule_engine_result_from_json(const nlohmann::json& j);

// canonical_json: the hashed projection of a result. Contains case_id, engine_version,
// rulebook_version, triggered_rules and discarded_rules sorted by rule_id, the sorted
// not_evaluable_rules ids, and summary_flags.
// Timestamps and timings are excluded.
[[nodiscard]] nlohmann::json canonical_json(const RuleEngineResult& result);

// deterministic_hash: SHA-256 (hex) of canonical_json(result).dump().
[[nodiscard]] std::string deterministic_hash(const RuleEngineResult& result);

// validate_partition checks that triggered and discarded are disjoint, cover evaluated exactly,
// agree with each decision's applies flag, and share no id with not_evaluable_rules.
[[nodiscard]] bool validate_partition(const RuleEngineResult& result);

}  // namespace lexrisk::engine
