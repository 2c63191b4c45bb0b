#include "eval_expr.h"

#include "lexrisk/core/logging.h"
#include "lexrisk/expression/case_variables.h"
#include "lexrisk/expression/evaluator.h"

#include "shared/arg_parser.h"
#include "shared/file_io.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct EvalExprCliConfig {
  std::optional<std::string> variables_path;
  bool print_value{false};
  std::optional<std::string> log_level;
};

}  // namespace

int cmd_eval_expr(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<lexrisk::apps::Option<EvalExprCliConfig>> options = {
      {"--variables", true, "JSON object of variables",
       [](EvalExprCliConfig& c, const std::string& v) {
         c.variables_path = v;
         return true;
       }},
      {"--value", false, "Print the scalar result instead of its boolean view",
       [](EvalExprCliConfig& c, const std::string&) {
         c.print_value = true;
         return true;
       }},
      {"--log-level", true, "trace|debug|info|warn|error|off",
       [](EvalExprCliConfig& c, const std::string& v) {
         c.log_level = v;
         return lexrisk::core::parse_log_level(v).has_value();
       }},
  };
  auto parsed = lexrisk::apps::parse_options(argc, argv, options);
  lexrisk::core::configure_logging(parsed.config.log_level);

  if (!parsed.ok || parsed.positionals.size() != 1) {
    std::cerr << "Usage: lexrisk_cli eval-expr EXPRESSION [options]\n";
    lexrisk::apps::print_options(std::cerr, options);
    return 1;
  }

  lexrisk::expression::VariableEnvironment variables;
  if (parsed.config.variables_path.has_value()) {
    auto text = lexrisk::apps::read_text_file(*parsed.config.variables_path);
    if (!text.has_value()) {
      std::cerr << "Failed to read variables: " << text.error() << "\n";
      return 1;
    }
    try {
      variables =
          lexrisk::expression::case_variables_from_json(nlohmann::json::parse(text.value()));
    } catch (const nlohmann::json::parse_error& e) {
      std::cerr << "Variables file is not valid JSON: " << e.what() << "\n";
      return 1;
    } catch (const std::invalid_argument& e) {
      std::cerr << "Invalid variables: " << e.what() << "\n";
      return 1;
    }
  }

  const lexrisk::expression::ExpressionEvaluator evaluator(variables);
  const std::string& expression = parsed.positionals.front();
  if (parsed.config.print_value) {
    std::cout << lexrisk::expression::to_display_string(evaluator.evaluate_value(expression))
              << "\n";
    return 0;
  }

  const auto result = evaluator.evaluate(expression);
  if (!result.has_value()) {
    std::cout << "null\n";
  } else {
    std::cout << (*result ? "true" : "false") << "\n";
  }
  return 0;
}
