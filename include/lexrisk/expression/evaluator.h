#pragma once

#include "lexrisk/expression/token.h"
#include "lexrisk/expression/value.h"

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace lexrisk::expression {

// ExpressionEvaluator evaluates rule conditions over a read-only variable snapshot.
//
// The language is closed: literals, identifiers, == != > < >= <=, AND OR NOT, parentheses and
// the functions MIN MAX COUNT SUM. Nothing is ever handed to a host-language evaluator.
//
// Evaluation order:
//   1. innermost parenthesised group (last '(' first) is evaluated and substituted back,
//      as a function call when the '(' follows a function name;
//   2. on the flat stream: NOT, then comparisons left to right, then AND, then OR.
//
// Logic is three-valued: a missing variable resolves to null, NOT null is null, and AND / OR
// only yield null when the known side does not already decide the result.
//
// The evaluator holds a reference to the caller's environment and no other state; construct one
// per evaluation call. The environment must outlive the evaluator.
class ExpressionEvaluator {
 public:
  explicit ExpressionEvaluator(const VariableEnvironment& variables) : variables_(variables) {}

  ExpressionEvaluator(const ExpressionEvaluator&) = delete;
  ExpressionEvaluator& operator=(const ExpressionEvaluator&) = delete;
  ExpressionEvaluator(ExpressionEvaluator&&) = delete;
  ExpressionEvaluator& operator=(ExpressionEvaluator&&) = delete;
  ~ExpressionEvaluator() = default;

  // Boolean view of the expression: nullopt when the result is null or evaluation failed.
  // Non-boolean results are converted by truthiness. Never throws.
  [[nodiscard]] std::optional<bool> evaluate(std::string_view expression) const;

  // Scalar result of the expression; null when evaluation failed. Never throws.
  [[nodiscard]] Value evaluate_value(std::string_view expression) const;

  // Scalar result of the expression. Throws ExpressionError on malformed input or type mismatch.
  [[nodiscard]] Value evaluate_strict(std::string_view expression) const;

  [[nodiscard]] const VariableEnvironment& variables() const noexcept { return variables_; }

 private:
  [[nodiscard]] Value resolve_operand(const Token& token) const;
  [[nodiscard]] Value evaluate_tokens(std::vector<Token> tokens) const;

  const VariableEnvironment& variables_;
};

// Convenience wrapper: a fresh evaluator for a single call.
[[nodiscard]] std::optional<bool> evaluate(std::string_view expression,
                                           const VariableEnvironment& variables);

// referenced_identifiers lists the identifiers an expression reads, in name order.
// Literals, keywords and function names are excluded. Throws ExpressionError if the expression
// does not tokenize.
[[nodiscard]] std::set<std::string> referenced_identifiers(std::string_view expression);

}  // namespace lexrisk::expression
