#include "lexrisk/rules/rulebook_loader.h"

#include "lexrisk/core/logging.h"
#include "lexrisk/expression/evaluator.h"

#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace lexrisk::rules {

namespace {

using json = nlohmann::json;

std::string join_violations(const std::vector<std::string>& violations) {
  std::string message =
      "rulebook validation failed with " + std::to_string(violations.size()) + " violation(s)";
  for (const auto& v : violations) {
    message += "\n  " + v;
  }
  return message;
}

// Collects structural violations with their field paths.
class SchemaChecker {
 public:
  [[nodiscard]] const std::vector<std::string>& violations() const { return violations_; }

  void add(const std::string& path, const std::string& message) {
    violations_.push_back(path + ": " + message);
  }

  // Required member of the given kind. Returns the member when present and well-typed.
  const json* require(const json& parent, const std::string& parent_path, const char* key,
                      json::value_t kind) {
    const std::string path = parent_path.empty() ? key : parent_path + "." + key;
    const auto it = parent.find(key);
    if (it == parent.end()) {
      add(path, "missing required field");
      return nullptr;
    }
    if (!has_kind(*it, kind)) {
      add(path, std::string("expected ") + kind_name(kind) + ", got " + it->type_name());
      return nullptr;
    }
    return &*it;
  }

  // Optional member: absent and null are accepted.
  const json* optional(const json& parent, const std::string& parent_path, const char* key,
                       json::value_t kind) {
    const auto it = parent.find(key);
    if (it == parent.end() || it->is_null()) {
      return nullptr;
    }
    if (!has_kind(*it, kind)) {
      add(parent_path + "." + key,
          std::string("expected ") + kind_name(kind) + ", got " + it->type_name());
      return nullptr;
    }
    return &*it;
  }

  void string_array(const json& array, const std::string& path) {
    for (std::size_t i = 0; i < array.size(); ++i) {
      if (!array[i].is_string()) {
        add(path + "[" + std::to_string(i) + "]",
            std::string("expected string, got ") + array[i].type_name());
      }
    }
  }

  void optional_strings(const json& parent, const std::string& parent_path,
                        std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
      (void)optional(parent, parent_path, key, json::value_t::string);
    }
  }

 private:
  static bool has_kind(const json& j, json::value_t kind) {
    switch (kind) {
      case json::value_t::object:
        return j.is_object();
      case json::value_t::array:
        return j.is_array();
      case json::value_t::string:
        return j.is_string();
      default:
        return j.type() == kind;
    }
  }

  static const char* kind_name(json::value_t kind) {
    switch (kind) {
      case json::value_t::object:
        return "object";
      case json::value_t::array:
        return "array";
      case json::value_t::string:
        return "string";
      default:
        return "value";
    }
  }

  std::vector<std::string> violations_;
};

void check_rule(SchemaChecker& checker, const json& rule, const std::string& path) {
  if (!rule.is_object()) {
    checker.add(path, std::string("expected object, got ") + rule.type_name());
    return;
  }

  if (const json* id = checker.require(rule, path, "rule_id", json::value_t::string)) {
    if (id->get_ref<const std::string&>().empty()) {
      checker.add(path + ".rule_id", "must not be empty");
    }
  }
  (void)checker.require(rule, path, "risk_type", json::value_t::string);
  if (const json* refs = checker.require(rule, path, "article_refs", json::value_t::array)) {
    checker.string_array(*refs, path + ".article_refs");
  }

  if (const json* trigger = checker.require(rule, path, "trigger", json::value_t::object)) {
    const std::string trigger_path = path + ".trigger";
    (void)checker.require(*trigger, trigger_path, "condition", json::value_t::string);
    if (const json* vars =
            checker.optional(*trigger, trigger_path, "variables_required", json::value_t::array)) {
      checker.string_array(*vars, trigger_path + ".variables_required");
    }
  }

  if (const json* evidence =
          checker.require(rule, path, "evidence_required", json::value_t::object)) {
    const std::string evidence_path = path + ".evidence_required";
    for (const char* key : {"document_types", "descriptions"}) {
      if (const json* list = checker.optional(*evidence, evidence_path, key, json::value_t::array)) {
        checker.string_array(*list, evidence_path + "." + key);
      }
    }
  }

  if (const json* severity = checker.require(rule, path, "severity_logic", json::value_t::object)) {
    checker.optional_strings(*severity, path + ".severity_logic",
                             {"critical", "high", "medium", "low"});
  }
  if (const json* confidence =
          checker.require(rule, path, "confidence_logic", json::value_t::object)) {
    checker.optional_strings(*confidence, path + ".confidence_logic",
                             {"high", "medium", "low", "indeterminate"});
  }

  if (const json* outputs = checker.require(rule, path, "outputs", json::value_t::object)) {
    const std::string outputs_path = path + ".outputs";
    (void)checker.require(*outputs, outputs_path, "description_template", json::value_t::string);
    (void)checker.require(*outputs, outputs_path, "recommendation_template",
                          json::value_t::string);
    (void)checker.optional(*outputs, outputs_path, "missing_data_template", json::value_t::string);
  }
}

std::optional<std::string> optional_string(const json& parent, const char* key) {
  const auto it = parent.find(key);
  if (it == parent.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

std::vector<std::string> string_list(const json& parent, const char* key) {
  const auto it = parent.find(key);
  if (it == parent.end() || it->is_null()) {
    return {};
  }
  return it->get<std::vector<std::string>>();
}

// Precondition: check_rule() reported no violation for this element.
Rule build_rule(const json& j) {
  Rule rule;
  rule.rule_id = j.at("rule_id").get<std::string>();
  rule.risk_type = j.at("risk_type").get<std::string>();
  rule.article_refs = j.at("article_refs").get<std::vector<std::string>>();

  const json& trigger = j.at("trigger");
  rule.trigger.condition = trigger.at("condition").get<std::string>();
  for (auto& name : string_list(trigger, "variables_required")) {
    rule.trigger.variables_required.insert(std::move(name));
  }

  const json& evidence = j.at("evidence_required");
  rule.evidence_required.document_types = string_list(evidence, "document_types");
  rule.evidence_required.descriptions = string_list(evidence, "descriptions");

  const json& severity = j.at("severity_logic");
  rule.severity_logic.critical = optional_string(severity, "critical");
  rule.severity_logic.high = optional_string(severity, "high");
  rule.severity_logic.medium = optional_string(severity, "medium");
  rule.severity_logic.low = optional_string(severity, "low");

  const json& confidence = j.at("confidence_logic");
  rule.confidence_logic.high = optional_string(confidence, "high");
  rule.confidence_logic.medium = optional_string(confidence, "medium");
  rule.confidence_logic.low = optional_string(confidence, "low");
  rule.confidence_logic.indeterminate = optional_string(confidence, "indeterminate");

  const json& outputs = j.at("outputs");
  rule.outputs.description_template = outputs.at("description_template").get<std::string>();
  rule.outputs.recommendation_template = outputs.at("recommendation_template").get<std::string>();
  rule.outputs.missing_data_template = optional_string(outputs, "missing_data_template");

  return rule;
}

void put_optional(json& j, const char* key, const std::optional<std::string>& value) {
  if (value.has_value()) {
    j[key] = *value;
  } else {
    j[key] = nullptr;
  }
}

void lint_condition(std::vector<std::string>& findings, const std::string& rule_id,
                    const char* field, const std::optional<std::string>& condition) {
  if (!condition.has_value()) {
    return;
  }
  try {
    (void)expression::referenced_identifiers(*condition);
  } catch (const expression::ExpressionError& e) {
    findings.push_back(rule_id + ": " + field + ": does not tokenize: " + e.what());
  }
}

}  // namespace

RulebookValidationError::RulebookValidationError(std::vector<std::string> violations)
    : std::runtime_error(join_violations(violations)), violations_(std::move(violations)) {}

Rulebook rulebook_from_json(const nlohmann::json& j) {
  SchemaChecker checker;
  if (!j.is_object()) {
    checker.add("$", std::string("expected object, got ") + j.type_name());
    throw RulebookValidationError(checker.violations());
  }

  (void)checker.require(j, "", "metadata", json::value_t::object);
  const json* rules = checker.require(j, "", "rules", json::value_t::array);

  if (rules != nullptr) {
    std::unordered_set<std::string> seen_ids;
    for (std::size_t i = 0; i < rules->size(); ++i) {
      const json& rule = (*rules)[i];
      const std::string path = "rules[" + std::to_string(i) + "]";
      check_rule(checker, rule, path);

      if (rule.is_object()) {
        const auto id = rule.find("rule_id");
        if (id != rule.end() && id->is_string() &&
            !seen_ids.insert(id->get<std::string>()).second) {
          checker.add(path + ".rule_id", "duplicate rule_id '" + id->get<std::string>() + "'");
        }
      }
    }
  }

  if (!checker.violations().empty()) {
    throw RulebookValidationError(checker.violations());
  }

  Rulebook rulebook;
  rulebook.metadata = j.at("metadata");
  rulebook.rules.reserve(rules->size());
  for (const auto& rule : *rules) {
    rulebook.rules.push_back(build_rule(rule));
  }

  for (const auto& finding : lint_rulebook(rulebook)) {
    core::log().warn("rulebook lint: {}", finding);
  }
  return rulebook;
}

nlohmann::json rulebook_to_json(const Rulebook& rulebook) {
  json rules = json::array();
  for (const auto& rule : rulebook.rules) {
    json trigger;
    trigger["condition"] = rule.trigger.condition;
    trigger["variables_required"] = rule.trigger.variables_required;

    json evidence;
    evidence["descriptions"] = rule.evidence_required.descriptions;
    evidence["document_types"] = rule.evidence_required.document_types;

    json severity;
    put_optional(severity, "critical", rule.severity_logic.critical);
    put_optional(severity, "high", rule.severity_logic.high);
    put_optional(severity, "low", rule.severity_logic.low);
    put_optional(severity, "medium", rule.severity_logic.medium);

    json confidence;
    put_optional(confidence, "high", rule.confidence_logic.high);
    put_optional(confidence, "indeterminate", rule.confidence_logic.indeterminate);
    put_optional(confidence, "low", rule.confidence_logic.low);
    put_optional(confidence, "medium", rule.confidence_logic.medium);

    json outputs;
    outputs["description_template"] = rule.outputs.description_template;
    put_optional(outputs, "missing_data_template", rule.outputs.missing_data_template);
    outputs["recommendation_template"] = rule.outputs.recommendation_template;

    json entry;
    entry["article_refs"] = rule.article_refs;
    entry["confidence_logic"] = std::move(confidence);
    entry["evidence_required"] = std::move(evidence);
    entry["outputs"] = std::move(outputs);
    entry["risk_type"] = rule.risk_type;
    entry["rule_id"] = rule.rule_id;
    entry["severity_logic"] = std::move(severity);
    entry["trigger"] = std::move(trigger);
    rules.push_back(std::move(entry));
  }

  json j;
  j["metadata"] = rulebook.metadata;
  j["rules"] = std::move(rules);
  return j;
}

Rulebook parse_rulebook(std::string_view json_text) {
  json document;
  try {
    document = json::parse(json_text.begin(), json_text.end());
  } catch (const json::parse_error& e) {
    throw RulebookLoadError(std::string("rulebook is not valid JSON: ") + e.what());
  }
  return rulebook_from_json(document);
}

Rulebook load_rulebook(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw RulebookLoadError("cannot open rulebook: " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    throw RulebookLoadError("failed reading rulebook: " + path.string());
  }

  Rulebook rulebook = parse_rulebook(buffer.str());
  core::log().info("rulebook loaded from {}: {} rule(s), version {}", path.string(),
                   rulebook.rules.size(), rulebook.version().value_or("<none>"));
  return rulebook;
}

std::vector<std::filesystem::path> default_rulebook_candidates() {
  std::vector<std::filesystem::path> candidates;
  if (const char* env = std::getenv(kRulebookPathEnv); env != nullptr && *env != '\0') {
    candidates.emplace_back(env);
  }
#ifdef LEXRISK_DEFAULT_RULEBOOK_PATH
  candidates.emplace_back(LEXRISK_DEFAULT_RULEBOOK_PATH);
#endif
  candidates.emplace_back(kBundledRulebookPath);
  return candidates;
}

Rulebook load_default_rulebook() {
  const auto candidates = default_rulebook_candidates();
  for (const auto& candidate : candidates) {
    std::error_code ec;
    if (std::filesystem::is_regular_file(candidate, ec)) {
      return load_rulebook(candidate);
    }
  }

  std::string message = "no rulebook found; searched:";
  for (const auto& candidate : candidates) {
    message += " " + candidate.string();
  }
  throw RulebookLoadError(message);
}

std::vector<std::string> lint_rulebook(const Rulebook& rulebook) {
  std::vector<std::string> findings;
  for (const auto& rule : rulebook.rules) {
    try {
      for (const auto& name : expression::referenced_identifiers(rule.trigger.condition)) {
        if (rule.trigger.variables_required.count(name) == 0) {
          findings.push_back(rule.rule_id + ": trigger.condition: reads '" + name +
                             "' which is not listed in variables_required");
        }
      }
    } catch (const expression::ExpressionError& e) {
      findings.push_back(rule.rule_id + ": trigger.condition: does not tokenize: " + e.what());
    }

    lint_condition(findings, rule.rule_id, "severity_logic.critical",
                   rule.severity_logic.critical);
    lint_condition(findings, rule.rule_id, "severity_logic.high", rule.severity_logic.high);
    lint_condition(findings, rule.rule_id, "severity_logic.medium", rule.severity_logic.medium);
    lint_condition(findings, rule.rule_id, "severity_logic.low", rule.severity_logic.low);
    lint_condition(findings, rule.rule_id, "confidence_logic.high", rule.confidence_logic.high);
    lint_condition(findings, rule.rule_id, "confidence_logic.medium",
                   rule.confidence_logic.medium);
    lint_condition(findings, rule.rule_id, "confidence_logic.low", rule.confidence_logic.low);
    lint_condition(findings, rule.rule_id, "confidence_logic.indeterminate",
                   rule.confidence_logic.indeterminate);
  }
  return findings;
}

}  // namespace lexrisk::rules
