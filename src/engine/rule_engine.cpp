#include "lexrisk/engine/rule_engine.h"

#include "lexrisk/core/logging.h"
#include "lexrisk/expression/evaluator.h"
#include "lexrisk/expression/template_renderer.h"
#include "lexrisk/rules/escalation.h"

#include <exception>
#include <utility>

namespace lexrisk::engine {

namespace {

std::vector<std::string> present_variables(const rules::Rule& rule,
                                           const expression::VariableEnvironment& variables) {
  std::vector<std::string> found;
  for (const auto& name : rule.trigger.variables_required) {
    const auto it = variables.find(name);
    if (it != variables.end() && !expression::is_null(it->second)) {
      found.push_back(name);
    }
  }
  return found;
}

RuleDecision base_decision(const rules::Rule& rule) {
  RuleDecision decision;
  decision.rule_id = rule.rule_id;
  decision.risk_type = rule.risk_type;
  if (!rule.article_refs.empty()) {
    decision.article = rule.article_refs.front();
  }
  decision.evidence_required = rule.evidence_required.document_types;
  return decision;
}

RuleDecision triggered_decision(const rules::Rule& rule, const LegalRisk& risk,
                                const expression::VariableEnvironment& variables) {
  RuleDecision decision = base_decision(rule);
  decision.state = rules::RuleState::kTriggered;
  decision.applies = true;
  decision.severity = risk.severity;
  decision.confidence = risk.confidence;
  decision.legal_articles = risk.legal_articles;
  decision.evidence_status = risk.evidence_status;
  decision.evidence_found = present_variables(rule, variables);
  decision.rationale = "Condición '" + rule.trigger.condition + "' verdadera; severidad " +
                       rules::to_string(risk.severity) + ", confianza " +
                       rules::to_string(risk.confidence) + "; " +
                       std::to_string(risk.legal_articles.size()) + " de " +
                       std::to_string(rule.article_refs.size()) +
                       " artículo(s) verificados en el contexto legal.";
  return decision;
}

RuleDecision discarded_decision(const rules::Rule& rule, const Discarded& outcome,
                                const expression::VariableEnvironment& variables) {
  RuleDecision decision = base_decision(rule);
  decision.state = rules::RuleState::kDiscarded;
  decision.evidence_found = present_variables(rule, variables);
  if (outcome.trigger_result.has_value()) {
    decision.rationale = "Condición '" + rule.trigger.condition + "' falsa.";
  } else {
    decision.rationale =
        "Condición '" + rule.trigger.condition + "' indeterminada por datos nulos.";
  }
  return decision;
}

RuleDecision errored_decision(const rules::Rule& rule, const Errored& outcome) {
  RuleDecision decision = base_decision(rule);
  decision.state = rules::RuleState::kErrored;
  decision.rationale = "Error al evaluar la regla: " + outcome.error;
  return decision;
}

}  // namespace

std::string discarded_citation_note(const std::string& citation) {
  return "Cita descartada por no figurar en el contexto legal recuperado: " + citation;
}

RuleEngine::RuleEngine(const rules::Rulebook& rulebook, std::string legal_context)
    : rulebook_(rulebook),
      legal_context_(std::move(legal_context)),
      allowed_articles_(citation::extract_allowed_articles(legal_context_)) {}

RuleOutcome RuleEngine::evaluate_rule(const rules::Rule& rule,
                                      const expression::VariableEnvironment& variables) const {
  try {
    NotEvaluable not_evaluable;
    for (const auto& name : rule.trigger.variables_required) {
      if (variables.find(name) == variables.end()) {
        not_evaluable.missing_variables.push_back(name);
      }
    }
    if (!not_evaluable.missing_variables.empty()) {
      std::string names;
      for (const auto& name : not_evaluable.missing_variables) {
        names += names.empty() ? name : ", " + name;
      }
      core::log().debug("rule {} not evaluable: missing {}", rule.rule_id, names);
      return not_evaluable;
    }

    const expression::ExpressionEvaluator evaluator(variables);
    const expression::Value trigger = evaluator.evaluate_strict(rule.trigger.condition);
    if (expression::is_null(trigger) || !expression::truthy(trigger)) {
      Discarded discarded;
      if (!expression::is_null(trigger)) {
        discarded.trigger_result = false;
      }
      core::log().debug("rule {} discarded: trigger evaluated to {}", rule.rule_id,
                        expression::to_display_string(trigger));
      return discarded;
    }

    return Triggered{build_risk(rule, variables)};
  } catch (const std::exception& e) {
    core::log().error("rule {} errored: {}", rule.rule_id, e.what());
    return Errored{e.what()};
  }
}

LegalRisk RuleEngine::build_risk(const rules::Rule& rule,
                                 const expression::VariableEnvironment& variables) const {
  const expression::ExpressionEvaluator evaluator(variables);

  LegalRisk risk;
  risk.rule_id = rule.rule_id;
  risk.risk_type = rule.risk_type;
  risk.severity = rules::resolve_severity(rule.severity_logic, evaluator);
  risk.confidence = rules::resolve_confidence(rule.confidence_logic, evaluator);

  auto filtered = citation::filter_legal_articles(rule.article_refs, allowed_articles_,
                                                  legal_context_);
  if (!filtered.discarded.empty()) {
    risk.confidence = rules::Confidence::kIndeterminate;
  }

  if (!rule.article_refs.empty() && filtered.valid.empty()) {
    risk.evidence_status = rules::EvidenceStatus::kMissing;
  } else if (!filtered.discarded.empty() ||
             risk.confidence == rules::Confidence::kIndeterminate) {
    risk.evidence_status = rules::EvidenceStatus::kInsufficient;
  } else {
    risk.evidence_status = rules::EvidenceStatus::kSufficient;
  }

  risk.description = expression::render_template(rule.outputs.description_template, variables);
  risk.recommendation =
      expression::render_template(rule.outputs.recommendation_template, variables);

  if (risk.evidence_status != rules::EvidenceStatus::kSufficient &&
      rule.outputs.missing_data_template.has_value()) {
    risk.missing_data.push_back(
        expression::render_template(*rule.outputs.missing_data_template, variables));
  }
  for (const auto& citation : filtered.discarded) {
    risk.missing_data.push_back(discarded_citation_note(citation));
  }

  risk.legal_articles = std::move(filtered.valid);
  risk.discarded_articles = std::move(filtered.discarded);
  return risk;
}

std::vector<LegalRisk> RuleEngine::evaluate_rules(
    const expression::VariableEnvironment& variables) const {
  std::vector<LegalRisk> risks;
  for (const auto& rule : rulebook_.rules) {
    RuleOutcome outcome = evaluate_rule(rule, variables);
    if (auto* triggered = std::get_if<Triggered>(&outcome)) {
      risks.push_back(std::move(triggered->risk));
    }
  }
  return risks;
}

RuleEngineResult RuleEngine::run(const std::string& case_id,
                                 const expression::VariableEnvironment& variables,
                                 const core::IClock& clock,
                                 std::vector<LegalRisk>& risks) const {
  RuleEngineResultBuilder builder(case_id, rulebook_.version(), clock);
  bool has_critical = false;
  bool has_discarded_citations = false;
  bool has_errored = false;
  bool has_not_evaluable = false;
  bool has_triggered = false;

  for (const auto& rule : rulebook_.rules) {
    RuleOutcome outcome = evaluate_rule(rule, variables);

    if (std::holds_alternative<NotEvaluable>(outcome)) {
      has_not_evaluable = true;
      builder.add_not_evaluable(rule.rule_id);
    } else if (const auto* discarded = std::get_if<Discarded>(&outcome)) {
      builder.add_decision(discarded_decision(rule, *discarded, variables));
    } else if (auto* triggered = std::get_if<Triggered>(&outcome)) {
      has_triggered = true;
      has_critical = has_critical || triggered->risk.severity == rules::Severity::kCritical;
      has_discarded_citations =
          has_discarded_citations || !triggered->risk.discarded_articles.empty();
      builder.add_decision(triggered_decision(rule, triggered->risk, variables));
      risks.push_back(std::move(triggered->risk));
    } else if (const auto* errored = std::get_if<Errored>(&outcome)) {
      has_errored = true;
      builder.add_decision(errored_decision(rule, *errored));
    }
  }

  builder.add_flag(kFlagHasTriggeredRules, has_triggered);
  builder.add_flag(kFlagHasCriticalRisk, has_critical);
  builder.add_flag(kFlagHasDiscardedCitations, has_discarded_citations);
  builder.add_flag(kFlagHasNotEvaluableRules, has_not_evaluable);
  builder.add_flag(kFlagHasErroredRules, has_errored);

  RuleEngineResult result = builder.build();
  core::log().info("case {}: {} evaluated, {} triggered, {} not evaluable", case_id,
                   result.evaluated_rules.size(), result.triggered_rules.size(),
                   result.not_evaluable_rules.size());
  return result;
}

RuleEngineResult RuleEngine::evaluate(const std::string& case_id,
                                      const expression::VariableEnvironment& variables,
                                      const core::IClock& clock) const {
  std::vector<LegalRisk> risks;
  return run(case_id, variables, clock, risks);
}

RuleEngineResult RuleEngine::evaluate(const std::string& case_id,
                                      const expression::VariableEnvironment& variables) const {
  const core::SystemClock clock;
  return evaluate(case_id, variables, clock);
}

CaseAnalysis RuleEngine::analyze(const std::string& case_id,
                                 const expression::VariableEnvironment& variables,
                                 const core::IClock& clock) const {
  std::vector<LegalRisk> risks;
  RuleEngineResult result = run(case_id, variables, clock, risks);
  LegalAnalysis analysis = build_result(case_id, risks);
  return CaseAnalysis{std::move(result), std::move(analysis)};
}

CaseAnalysis RuleEngine::analyze(const std::string& case_id,
                                 const expression::VariableEnvironment& variables) const {
  const core::SystemClock clock;
  return analyze(case_id, variables, clock);
}

std::vector<LegalRisk> evaluate_rules(const rules::Rulebook& rulebook,
                                      const expression::VariableEnvironment& variables,
                                      const std::string& legal_context) {
  const RuleEngine engine(rulebook, legal_context);
  return engine.evaluate_rules(variables);
}

}  // namespace lexrisk::engine
