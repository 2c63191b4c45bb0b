#include "lexrisk/core/logging.h"
#include "lexrisk/core/version.h"

#include "commands/eval_expr.h"
#include "commands/evaluate.h"
#include "commands/validate_rulebook.h"

#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "lexrisk_cli " << lexrisk::core::kBuildVersion << " (engine "
            << lexrisk::core::kEngineVersion << ")\n"
            << "Usage: lexrisk_cli <command> [options]\n"
            << "Commands:\n"
            << "  evaluate --case-id ID --variables FILE [--rulebook FILE] [--context FILE]\n"
            << "           [--db FILE] [--fixed-time ISO] [--log-level L]\n"
            << "  validate-rulebook [FILE] [--strict]\n"
            << "  eval-expr EXPRESSION [--variables FILE] [--value]\n"
            << "Environment: LEXRISK_RULEBOOK_PATH, LEXRISK_LOG_LEVEL\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  lexrisk::core::configure_logging();

  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "evaluate") {
    return cmd_evaluate(argc, argv);
  }
  if (subcommand == "validate-rulebook") {
    return cmd_validate_rulebook(argc, argv);
  }
  if (subcommand == "eval-expr") {
    return cmd_eval_expr(argc, argv);
  }
  if (subcommand == "--version") {
    std::cout << lexrisk::core::kBuildVersion << "\n";
    return 0;
  }

  if (subcommand != "--help" && subcommand != "-h") {
    std::cerr << "Unknown command: " << subcommand << "\n";
  }
  print_usage();
  return subcommand == "--help" || subcommand == "-h" ? 0 : 1;
}
