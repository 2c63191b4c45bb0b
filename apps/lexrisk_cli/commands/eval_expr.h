#pragma once

// cmd_eval_expr: evaluate a single expression, optionally against a --variables file, and print
// true, false or null (or the scalar value with --value).
int cmd_eval_expr(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
