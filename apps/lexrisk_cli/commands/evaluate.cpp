#include "evaluate.h"

#include "lexrisk/core/clock.h"
#include "lexrisk/core/logging.h"
#include "lexrisk/expression/case_variables.h"
#include "lexrisk/rules/rulebook_loader.h"
#include "lexrisk/storage/sqlite/sqlite_db.h"
#include "lexrisk/storage/sqlite/sqlite_result_store.h"

#include "evaluate_logic.h"
#include "shared/arg_parser.h"
#include "shared/file_io.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct EvaluateCliConfig {
  std::optional<std::string> case_id;
  std::optional<std::string> variables_path;
  std::optional<std::string> rulebook_path;
  std::optional<std::string> context_path;
  std::optional<std::string> db_path;
  std::optional<std::string> fixed_time;
  std::optional<std::string> log_level;
};

const std::vector<lexrisk::apps::Option<EvaluateCliConfig>>& evaluate_options() {
  static const std::vector<lexrisk::apps::Option<EvaluateCliConfig>> options = {
      {"--case-id", true, "Case identifier recorded in the result",
       [](EvaluateCliConfig& c, const std::string& v) {
         c.case_id = v;
         return true;
       }},
      {"--variables", true, "JSON object of case variables (scalars only)",
       [](EvaluateCliConfig& c, const std::string& v) {
         c.variables_path = v;
         return true;
       }},
      {"--rulebook", true, "Rulebook JSON file (default: bundled rulebook search)",
       [](EvaluateCliConfig& c, const std::string& v) {
         c.rulebook_path = v;
         return true;
       }},
      {"--context", true, "Plain-text legal context used for the citation allow-list",
       [](EvaluateCliConfig& c, const std::string& v) {
         c.context_path = v;
         return true;
       }},
      {"--db", true, "SQLite result store for replay",
       [](EvaluateCliConfig& c, const std::string& v) {
         c.db_path = v;
         return true;
       }},
      {"--fixed-time", true, "Use a fixed ISO 8601 timestamp instead of the system clock",
       [](EvaluateCliConfig& c, const std::string& v) {
         c.fixed_time = v;
         return true;
       }},
      {"--log-level", true, "trace|debug|info|warn|error|off",
       [](EvaluateCliConfig& c, const std::string& v) {
         if (!lexrisk::core::parse_log_level(v).has_value()) {
           std::cerr << "Invalid --log-level: " << v << "\n";
           return false;
         }
         c.log_level = v;
         return true;
       }},
  };
  return options;
}

std::optional<lexrisk::rules::Rulebook> load_rulebook_or_report(
    const std::optional<std::string>& path) {
  try {
    if (path.has_value()) {
      return lexrisk::rules::load_rulebook(*path);
    }
    return lexrisk::rules::load_default_rulebook();
  } catch (const lexrisk::rules::RulebookValidationError& e) {
    std::cerr << "Invalid rulebook:\n";
    for (const auto& violation : e.violations()) {
      std::cerr << "  " << violation << "\n";
    }
  } catch (const lexrisk::rules::RulebookLoadError& e) {
    std::cerr << "Failed to load rulebook: " << e.what() << "\n";
  }
  return std::nullopt;
}

std::optional<lexrisk::expression::VariableEnvironment> load_variables_or_report(
    const std::string& path) {
  auto text = lexrisk::apps::read_text_file(path);
  if (!text.has_value()) {
    std::cerr << "Failed to read variables: " << text.error() << "\n";
    return std::nullopt;
  }
  try {
    return lexrisk::expression::case_variables_from_json(nlohmann::json::parse(text.value()));
  } catch (const nlohmann::json::parse_error& e) {
    std::cerr << "Variables file is not valid JSON: " << e.what() << "\n";
  } catch (const std::invalid_argument& e) {
    std::cerr << "Invalid case variables: " << e.what() << "\n";
  }
  return std::nullopt;
}

}  // namespace

int cmd_evaluate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto& options = evaluate_options();
  auto parsed = lexrisk::apps::parse_options(argc, argv, options);
  auto& config = parsed.config;
  lexrisk::core::configure_logging(config.log_level);

  if (!parsed.ok || !config.case_id.has_value() || !config.variables_path.has_value()) {
    std::cerr << "Usage: lexrisk_cli evaluate --case-id <id> --variables <file> [options]\n";
    lexrisk::apps::print_options(std::cerr, options);
    return 1;
  }

  const auto rulebook = load_rulebook_or_report(config.rulebook_path);
  if (!rulebook.has_value()) {
    return 1;
  }

  auto variables = load_variables_or_report(*config.variables_path);
  if (!variables.has_value()) {
    return 1;
  }

  EvaluateInput input;
  input.case_id = *config.case_id;
  input.variables = std::move(*variables);
  if (config.context_path.has_value()) {
    auto context = lexrisk::apps::read_text_file(*config.context_path);
    if (!context.has_value()) {
      std::cerr << "Failed to read legal context: " << context.error() << "\n";
      return 1;
    }
    input.legal_context = context.value();
  }

  std::unique_ptr<lexrisk::core::IClock> clock;
  if (config.fixed_time.has_value()) {
    clock = std::make_unique<lexrisk::core::FixedClock>(*config.fixed_time);
  } else {
    clock = std::make_unique<lexrisk::core::SystemClock>();
  }

  if (!config.db_path.has_value()) {
    return execute_evaluate(*rulebook, input, nullptr, *clock, std::cout);
  }

  auto db_result = lexrisk::storage::sqlite::SqliteDb::open(*config.db_path);
  if (!db_result.has_value()) {
    std::cerr << "Failed to open database: " << db_result.error() << "\n";
    return 1;
  }
  auto db = db_result.value();
  auto schema_result = db->ensure_schema_v1();
  if (!schema_result.has_value()) {
    std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
    return 1;
  }

  lexrisk::storage::sqlite::SqliteResultStore store(db);
  return execute_evaluate(*rulebook, input, &store, *clock, std::cout);
}
