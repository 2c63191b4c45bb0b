#pragma once

#include "lexrisk/expression/value.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace lexrisk::expression {

// ExpressionError reports a malformed expression or an operation on incompatible types.
// It never crosses the public evaluate() boundary: the evaluator converts it to a null result.
class ExpressionError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

enum class TokenKind {
  kLeftParen,
  kRightParen,
  kComma,
  kComparison,  // == != > < >= <=
  kAnd,
  kOr,
  kNot,
  kFunction,  // MIN MAX COUNT SUM
  kOperand,   // unresolved literal or identifier spelling
  kValue,     // resolved scalar (quoted strings, substituted sub-expression results)
};

enum class Comparison { kEqual, kNotEqual, kGreater, kLess, kGreaterEqual, kLessEqual };

enum class Function { kMin, kMax, kCount, kSum };

struct Token {
  TokenKind kind{TokenKind::kOperand};
  std::string text;  // source spelling; empty for substituted results
  Value value{};     // meaningful only for kValue
  Comparison comparison{Comparison::kEqual};
  Function function{Function::kMin};
};

// tokenize splits an expression into tokens, left to right.
// Words are accumulated between boundaries (whitespace, parentheses, commas, quotes and operator
// characters) and then classified, so a keyword is only recognised as a whole word: "BRAND" is
// an operand, "AND" is a connective. Keywords and function names are upper-case only.
// Throws ExpressionError on an unterminated string or a stray '=' / '!'.
[[nodiscard]] std::vector<Token> tokenize(std::string_view expression);

// parse_literal returns the value of a literal spelling (true/True, false/False, null, integer,
// decimal), or nullopt when the spelling is an identifier.
[[nodiscard]] std::optional<Value> parse_literal(std::string_view spelling);

}  // namespace lexrisk::expression
