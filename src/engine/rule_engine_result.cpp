#include "lexrisk/engine/rule_engine_result.h"

#include "lexrisk/core/sha256.h"
#include "lexrisk/core/version.h"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

namespace lexrisk::engine {

namespace {

using json = nlohmann::json;

std::vector<RuleDecision> sorted_by_rule_id(std::vector<RuleDecision> decisions) {
  std::stable_sort(decisions.begin(), decisions.end(),
                   [](const RuleDecision& a, const RuleDecision& b) {
                     return a.rule_id < b.rule_id;
                   });
  return decisions;
}

json decisions_to_json(const std::vector<RuleDecision>& decisions) {
  json array = json::array();
  for (const auto& d : decisions) {
    array.push_back(rule_decision_to_json(d));
  }
  return array;
}

std::vector<RuleDecision> decisions_from_json(const json& array) {
  std::vector<RuleDecision> decisions;
  decisions.reserve(array.size());
  for (const auto& item : array) {
    decisions.push_back(rule_decision_from_json(item));
  }
  return decisions;
}

std::set<std::string> ids_of(const std::vector<RuleDecision>& decisions) {
  std::set<std::string> ids;
  for (const auto& d : decisions) {
    ids.insert(d.rule_id);
  }
  return ids;
}

}  // namespace

RuleEngineResultBuilder::RuleEngineResultBuilder(std::string case_id,
                                                 std::optional<std::string> rulebook_version,
                                                 const core::IClock& clock)
    : case_id_(std::move(case_id)),
      rulebook_version_(std::move(rulebook_version)),
      clock_(clock),
      started_micros_(clock.monotonic_micros()) {}

void RuleEngineResultBuilder::add_decision(RuleDecision decision) {
  decisions_.push_back(std::move(decision));
}

void RuleEngineResultBuilder::add_not_evaluable(std::string rule_id) {
  not_evaluable_.push_back(std::move(rule_id));
}

void RuleEngineResultBuilder::add_flag(const std::string& name, bool value) {
  flags_[name] = value;
}

RuleEngineResult RuleEngineResultBuilder::build() const {
  RuleEngineResult result;
  result.case_id = case_id_;
  result.engine_version = core::kEngineVersion;
  result.rulebook_version = rulebook_version_;
  result.evaluated_rules = decisions_;
  for (const auto& d : decisions_) {
    if (d.applies) {
      result.triggered_rules.push_back(d);
    } else {
      result.discarded_rules.push_back(d);
    }
  }
  result.not_evaluable_rules = not_evaluable_;
  result.summary_flags = flags_;
  result.evaluated_at = clock_.now_iso8601();
  result.execution_time_ms =
      static_cast<double>(clock_.monotonic_micros() - started_micros_) / 1000.0;
  return result;
}

json rule_decision_to_json(const RuleDecision& decision) {
  json j;
  j["applies"] = decision.applies;
  j["article"] = decision.article;
  j["confidence"] = rules::to_string(decision.confidence);
  j["evidence_found"] = decision.evidence_found;
  j["evidence_required"] = decision.evidence_required;
  if (decision.evidence_status.has_value()) {
    j["evidence_status"] = rules::to_string(*decision.evidence_status);
  } else {
    j["evidence_status"] = nullptr;
  }
  j["legal_articles"] = decision.legal_articles;
  j["rationale"] = decision.rationale;
  j["risk_type"] = decision.risk_type;
  j["rule_id"] = decision.rule_id;
  j["severity"] = rules::to_string(decision.severity);
  j["state"] = rules::to_string(decision.state);
  return j;
}

RuleDecision rule_decision_from_json(const json& j) {
  RuleDecision decision;
  decision.rule_id = j.at("rule_id").get<std::string>();
  decision.risk_type = j.at("risk_type").get<std::string>();
  decision.article = j.value("article", std::string{});
  decision.applies = j.at("applies").get<bool>();
  decision.legal_articles = j.at("legal_articles").get<std::vector<std::string>>();
  decision.evidence_required = j.at("evidence_required").get<std::vector<std::string>>();
  decision.evidence_found = j.at("evidence_found").get<std::vector<std::string>>();
  decision.rationale = j.at("rationale").get<std::string>();

  const auto state = rules::rule_state_from_string(j.at("state").get<std::string>());
  const auto severity = rules::severity_from_string(j.at("severity").get<std::string>());
  const auto confidence = rules::confidence_from_string(j.at("confidence").get<std::string>());
  if (!state || !severity || !confidence) {
    throw std::invalid_argument("rule decision '" + decision.rule_id +
                                "' has an unknown state or level term");
  }
  decision.state = *state;
  decision.severity = *severity;
  decision.confidence = *confidence;

  if (!j.at("evidence_status").is_null()) {
    const auto evidence =
        rules::evidence_status_from_string(j.at("evidence_status").get<std::string>());
    if (!evidence) {
      throw std::invalid_argument("rule decision '" + decision.rule_id +
                                  "' has an unknown evidence status");
    }
    decision.evidence_status = *evidence;
  }
  return decision;
}

json rule_engine_result_to_json(const RuleEngineResult& result) {
  json j;
  j["case_id"] = result.case_id;
  j["discarded_rules"] = decisions_to_json(result.discarded_rules);
  j["engine_version"] = result.engine_version;
  j["evaluated_at"] = result.evaluated_at;
  j["evaluated_rules"] = decisions_to_json(result.evaluated_rules);
  j["execution_time_ms"] = result.execution_time_ms;
  j["not_evaluable_rules"] = result.not_evaluable_rules;
  if (result.rulebook_version.has_value()) {
    j["rulebook_version"] = *result.rulebook_version;
  } else {
    j["rulebook_version"] = nullptr;
  }
  j["summary_flags"] = result.summary_flags;
  j["triggered_rules"] = decisions_to_json(result.triggered_rules);
  return j;
}

RuleEngineResult rule_engine_result_from_json(const json& j) {
  RuleEngineResult result;
  result.case_id = j.at("case_id").get<std::string>();
  result.engine_version = j.at("engine_version").get<std::string>();
  if (!j.at("rulebook_version").is_null()) {
    result.rulebook_version = j.at("rulebook_version").get<std::string>();
  }
  result.evaluated_rules = decisions_from_json(j.at("evaluated_rules"));
  result.triggered_rules = decisions_from_json(j.at("triggered_rules"));
  result.discarded_rules = decisions_from_json(j.at("discarded_rules"));
  result.not_evaluable_rules = j.at("not_evaluable_rules").get<std::vector<std::string>>();
  result.summary_flags = j.at("summary_flags").get<std::map<std::string, bool>>();
  result.evaluated_at = j.at("evaluated_at").get<std::string>();
  result.execution_time_ms = j.at("execution_time_ms").get<double>();
  return result;
}

json canonical_json(const RuleEngineResult& result) {
  json j;
  j["case_id"] = result.case_id;
  j["discarded_rules"] = decisions_to_json(sorted_by_rule_id(result.discarded_rules));
  j["engine_version"] = result.engine_version;
  auto not_evaluable = result.not_evaluable_rules;
  std::sort(not_evaluable.begin(), not_evaluable.end());
  j["not_evaluable_rules"] = not_evaluable;
  if (result.rulebook_version.has_value()) {
    j["rulebook_version"] = *result.rulebook_version;
  } else {
    j["rulebook_version"] = nullptr;
  }
  j["summary_flags"] = result.summary_flags;
  j["triggered_rules"] = decisions_to_json(sorted_by_rule_id(result.triggered_rules));
  return j;
}

std::string deterministic_hash(const RuleEngineResult& result) {
  return core::sha256_hex(canonical_json(result).dump());
}

bool validate_partition(const RuleEngineResult& result) {
  for (const auto& d : result.triggered_rules) {
    if (!d.applies || d.state != rules::RuleState::kTriggered) {
      return false;
    }
  }
  for (const auto& d : result.discarded_rules) {
    if (d.applies) {
      return false;
    }
  }

  const auto evaluated = ids_of(result.evaluated_rules);
  const auto triggered = ids_of(result.triggered_rules);
  const auto discarded = ids_of(result.discarded_rules);
  if (evaluated.size() != result.evaluated_rules.size() ||
      result.evaluated_rules.size() !=
          result.triggered_rules.size() + result.discarded_rules.size()) {
    return false;
  }

  std::set<std::string> joined = triggered;
  joined.insert(discarded.begin(), discarded.end());
  if (joined != evaluated || joined.size() != triggered.size() + discarded.size()) {
    return false;
  }

  return std::none_of(result.not_evaluable_rules.begin(), result.not_evaluable_rules.end(),
                      [&evaluated](const std::string& id) { return evaluated.count(id) > 0; });
}

}  // namespace lexrisk::engine
