#pragma once

// cmd_evaluate: evaluate one case (--case-id, --variables) against a rulebook and print the
// analysis and the deterministic result as JSON.
int cmd_evaluate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
