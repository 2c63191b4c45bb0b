#pragma once

#include "lexrisk/rules/rule.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace lexrisk::rules {

// RulebookLoadError: the rulebook source could not be read or is not valid JSON.
class RulebookLoadError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// RulebookValidationError: the JSON is well-formed but structurally invalid.
// violations() lists every problem found, each prefixed with its field path,
// e.g. "rules[2].trigger.condition: missing required field".
class RulebookValidationError : public std::runtime_error {
 public:
  explicit RulebookValidationError(std::vector<std::string> violations);

  [[nodiscard]] const std::vector<std::string>& violations() const noexcept {
    return violations_;
  }

 private:
  std::vector<std::string> violations_;
};

// Environment variable naming an explicit rulebook file for load_default_rulebook().
constexpr const char* kRulebookPathEnv = "LEXRISK_RULEBOOK_PATH";

// Bundled rulebook location relative to the working directory.
constexpr const char* kBundledRulebookPath = "data/rulebook/trlc_rules.json";

// rulebook_from_json validates the whole document before building anything, so a single call
// reports every violation. Throws RulebookValidationError.
[[nodiscard]] Rulebook rulebook_from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json rulebook_to_json(const Rulebook& rulebook);

// parse_rulebook: JSON text -> Rulebook. Throws RulebookLoadError on malformed JSON and
// RulebookValidationError on structural problems.
[[nodiscard]] Rulebook parse_rulebook(std::string_view json_text);

// load_rulebook reads and parses a rulebook file. Same errors as parse_rulebook, plus
// RulebookLoadError when the file cannot be opened. Lint findings are logged, never thrown.
[[nodiscard]] Rulebook load_rulebook(const std::filesystem::path& path);

// default_rulebook_candidates lists the search order used by load_default_rulebook():
//   1. $LEXRISK_RULEBOOK_PATH (when set and non-empty)
//   2. the build-time LEXRISK_DEFAULT_RULEBOOK_PATH (when compiled in)
//   3. data/rulebook/trlc_rules.json
[[nodiscard]] std::vector<std::filesystem::path> default_rulebook_candidates();

// load_default_rulebook loads the first existing candidate.
// Throws RulebookLoadError naming every candidate when none exists.
[[nodiscard]] Rulebook load_default_rulebook();

// lint_rulebook performs non-fatal consistency checks:
// - trigger and ladder conditions that do not tokenize;
// - identifiers read by a trigger condition but absent from trigger.variables_required.
// Each finding is "<rule_id>: <field>: <message>". Empty when the rulebook is clean.
[[nodiscard]] std::vector<std::string> lint_rulebook(const Rulebook& rulebook);

}  // namespace lexrisk::rules
