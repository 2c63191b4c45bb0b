#include "validate_rulebook.h"

#include "lexrisk/core/logging.h"
#include "lexrisk/rules/rulebook_loader.h"

#include "shared/arg_parser.h"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct ValidateCliConfig {
  bool strict{false};
  std::optional<std::string> log_level;
};

}  // namespace

int cmd_validate_rulebook(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<lexrisk::apps::Option<ValidateCliConfig>> options = {
      {"--strict", false, "Treat lint findings as errors",
       [](ValidateCliConfig& c, const std::string&) {
         c.strict = true;
         return true;
       }},
      {"--log-level", true, "trace|debug|info|warn|error|off",
       [](ValidateCliConfig& c, const std::string& v) {
         c.log_level = v;
         return lexrisk::core::parse_log_level(v).has_value();
       }},
  };
  auto parsed = lexrisk::apps::parse_options(argc, argv, options);
  // Lint findings are printed below; keep the loader's copies out of stderr unless asked.
  lexrisk::core::configure_logging(parsed.config.log_level.value_or("error"));

  if (!parsed.ok || parsed.positionals.size() > 1) {
    std::cerr << "Usage: lexrisk_cli validate-rulebook [FILE] [options]\n";
    lexrisk::apps::print_options(std::cerr, options);
    return 1;
  }

  lexrisk::rules::Rulebook rulebook;
  try {
    if (parsed.positionals.empty()) {
      rulebook = lexrisk::rules::load_default_rulebook();
    } else {
      rulebook = lexrisk::rules::load_rulebook(parsed.positionals.front());
    }
  } catch (const lexrisk::rules::RulebookValidationError& e) {
    std::cerr << "Rulebook is invalid (" << e.violations().size() << " violation(s)):\n";
    for (const auto& violation : e.violations()) {
      std::cerr << "  " << violation << "\n";
    }
    return 1;
  } catch (const lexrisk::rules::RulebookLoadError& e) {
    std::cerr << "Failed to load rulebook: " << e.what() << "\n";
    return 1;
  }

  const auto findings = lexrisk::rules::lint_rulebook(rulebook);
  std::cout << "Rulebook OK: " << rulebook.rules.size() << " rule(s), version "
            << rulebook.version().value_or("<none>") << "\n";
  for (const auto& finding : findings) {
    std::cout << "  lint: " << finding << "\n";
  }

  if (parsed.config.strict && !findings.empty()) {
    return 1;
  }
  return 0;
}
