#include "lexrisk/expression/evaluator.h"

#include "lexrisk/core/logging.h"

#include <algorithm>
#include <exception>
#include <iterator>
#include <limits>

namespace lexrisk::expression {

namespace {

using TokenList = std::vector<Token>;

Token value_token(Value value) {
  Token token;
  token.kind = TokenKind::kValue;
  token.value = std::move(value);
  return token;
}

// Replace tokens[first..last] (inclusive) with a single resolved value.
void splice(TokenList& tokens, std::size_t first, std::size_t last, Value value) {
  tokens[first] = value_token(std::move(value));
  tokens.erase(tokens.begin() + static_cast<std::ptrdiff_t>(first) + 1,
               tokens.begin() + static_cast<std::ptrdiff_t>(last) + 1);
}

std::optional<std::size_t> find_first(const TokenList& tokens, TokenKind kind) {
  const auto it = std::find_if(tokens.begin(), tokens.end(),
                               [kind](const Token& t) { return t.kind == kind; });
  if (it == tokens.end()) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(std::distance(tokens.begin(), it));
}

std::optional<std::size_t> find_last(const TokenList& tokens, TokenKind kind) {
  const auto it = std::find_if(tokens.rbegin(), tokens.rend(),
                               [kind](const Token& t) { return t.kind == kind; });
  if (it == tokens.rend()) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(std::distance(it, tokens.rend())) - 1;
}

// Tri-state view of a value: nullopt for null, truthiness otherwise.
std::optional<bool> as_logical(const Value& value) {
  if (is_null(value)) {
    return std::nullopt;
  }
  return truthy(value);
}

Value logical_not(const Value& operand) {
  const auto logical = as_logical(operand);
  if (!logical.has_value()) {
    return Value{};
  }
  return Value{!*logical};
}

Value logical_and(const Value& lhs, const Value& rhs) {
  const auto l = as_logical(lhs);
  const auto r = as_logical(rhs);
  if ((l.has_value() && !*l) || (r.has_value() && !*r)) {
    return Value{false};
  }
  if (!l.has_value() || !r.has_value()) {
    return Value{};
  }
  return Value{true};
}

Value logical_or(const Value& lhs, const Value& rhs) {
  const auto l = as_logical(lhs);
  const auto r = as_logical(rhs);
  if ((l.has_value() && *l) || (r.has_value() && *r)) {
    return Value{true};
  }
  if (!l.has_value() || !r.has_value()) {
    return Value{};
  }
  return Value{false};
}

bool values_equal(const Value& lhs, const Value& rhs) {
  if (is_null(lhs) || is_null(rhs)) {
    return is_null(lhs) && is_null(rhs);
  }
  if (is_numeric(lhs) && is_numeric(rhs)) {
    const auto* li = std::get_if<std::int64_t>(&lhs);
    const auto* ri = std::get_if<std::int64_t>(&rhs);
    if (li != nullptr && ri != nullptr) {
      return *li == *ri;
    }
    return as_double(lhs) == as_double(rhs);
  }
  if (lhs.index() != rhs.index()) {
    return false;
  }
  return lhs == rhs;
}

// Three-way ordering of two non-null values; throws on incomparable types.
int order(const Value& lhs, const Value& rhs) {
  if (is_numeric(lhs) && is_numeric(rhs)) {
    const auto* li = std::get_if<std::int64_t>(&lhs);
    const auto* ri = std::get_if<std::int64_t>(&rhs);
    if (li != nullptr && ri != nullptr) {
      return *li < *ri ? -1 : (*li > *ri ? 1 : 0);
    }
    const double l = as_double(lhs);
    const double r = as_double(rhs);
    return l < r ? -1 : (l > r ? 1 : 0);
  }
  const auto* ls = std::get_if<std::string>(&lhs);
  const auto* rs = std::get_if<std::string>(&rhs);
  if (ls != nullptr && rs != nullptr) {
    const int c = ls->compare(*rs);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
  }
  throw ExpressionError("cannot order " + std::string(type_name(lhs)) + " and " +
                        std::string(type_name(rhs)));
}

Value compare(Comparison op, const Value& lhs, const Value& rhs) {
  switch (op) {
    case Comparison::kEqual:
      return Value{values_equal(lhs, rhs)};
    case Comparison::kNotEqual:
      return Value{!values_equal(lhs, rhs)};
    default:
      break;
  }

  if (is_null(lhs) || is_null(rhs)) {
    return Value{};
  }
  const int c = order(lhs, rhs);
  switch (op) {
    case Comparison::kGreater:
      return Value{c > 0};
    case Comparison::kLess:
      return Value{c < 0};
    case Comparison::kGreaterEqual:
      return Value{c >= 0};
    case Comparison::kLessEqual:
      return Value{c <= 0};
    default:
      return Value{};
  }
}

bool all_integers(const std::vector<Value>& values) {
  return std::all_of(values.begin(), values.end(), [](const Value& v) {
    return std::holds_alternative<std::int64_t>(v);
  });
}

Value extremum(Function fn, const std::vector<Value>& args) {
  std::vector<Value> present;
  std::copy_if(args.begin(), args.end(), std::back_inserter(present),
               [](const Value& v) { return !is_null(v); });
  if (present.empty()) {
    return Value{};
  }
  for (const auto& v : present) {
    if (!is_numeric(v)) {
      throw ExpressionError(std::string(fn == Function::kMin ? "MIN" : "MAX") +
                            " expects numeric arguments, got " + std::string(type_name(v)));
    }
  }

  const bool want_min = fn == Function::kMin;
  const auto better = [want_min](const Value& a, const Value& b) {
    const double da = as_double(a);
    const double db = as_double(b);
    return want_min ? da < db : da > db;
  };
  Value best = present.front();
  for (const auto& v : present) {
    if (better(v, best)) {
      best = v;
    }
  }
  if (all_integers(present)) {
    return best;
  }
  return Value{as_double(best)};
}

bool add_overflows(std::int64_t a, std::int64_t b) noexcept {
  if (b > 0) {
    return a > std::numeric_limits<std::int64_t>::max() - b;
  }
  return a < std::numeric_limits<std::int64_t>::min() - b;
}

// Integers are summed exactly; an argument whose addition would leave int64 is accumulated
// as double instead.
Value sum(const std::vector<Value>& args) {
  std::int64_t integer_total = 0;
  double decimal_total = 0.0;
  bool saw_decimal = false;
  for (const auto& v : args) {
    if (const auto* i = std::get_if<std::int64_t>(&v)) {
      if (add_overflows(integer_total, *i)) {
        decimal_total += static_cast<double>(*i);
        saw_decimal = true;
      } else {
        integer_total += *i;
      }
    } else if (const auto* d = std::get_if<double>(&v)) {
      decimal_total += *d;
      saw_decimal = true;
    }
  }
  if (saw_decimal) {
    return Value{decimal_total + static_cast<double>(integer_total)};
  }
  return Value{integer_total};
}

Value call_function(Function fn, const std::vector<Value>& args) {
  switch (fn) {
    case Function::kMin:
    case Function::kMax:
      return extremum(fn, args);
    case Function::kSum:
      return sum(args);
    case Function::kCount:
      return Value{static_cast<std::int64_t>(
          std::count_if(args.begin(), args.end(), [](const Value& v) { return !is_null(v); }))};
  }
  throw ExpressionError("unknown function");
}

Value fold_flat(TokenList tokens);

// Split a function argument list on top-level commas.
std::vector<TokenList> split_arguments(const TokenList& inner) {
  std::vector<TokenList> args;
  if (inner.empty()) {
    return args;
  }
  TokenList current;
  int depth = 0;
  for (const auto& token : inner) {
    if (token.kind == TokenKind::kLeftParen) {
      ++depth;
    } else if (token.kind == TokenKind::kRightParen) {
      --depth;
    } else if (token.kind == TokenKind::kComma && depth == 0) {
      if (current.empty()) {
        throw ExpressionError("empty function argument");
      }
      args.push_back(std::move(current));
      current.clear();
      continue;
    }
    current.push_back(token);
  }
  if (current.empty()) {
    throw ExpressionError("empty function argument");
  }
  args.push_back(std::move(current));
  return args;
}

// Apply every binary operator of one kind, left to right.
template <typename Apply>
void fold_binary(TokenList& tokens, TokenKind kind, const char* name, Apply apply) {
  while (const auto idx = find_first(tokens, kind)) {
    const std::size_t i = *idx;
    if (i == 0 || i + 1 >= tokens.size() || tokens[i - 1].kind != TokenKind::kValue ||
        tokens[i + 1].kind != TokenKind::kValue) {
      throw ExpressionError(std::string("operator ") + name + " is missing an operand");
    }
    Value result = apply(tokens[i], tokens[i - 1].value, tokens[i + 1].value);
    splice(tokens, i - 1, i + 1, std::move(result));
  }
}

// Evaluate a parenthesis-free token run whose operands are already resolved.
Value fold_flat(TokenList tokens) {
  if (tokens.empty()) {
    throw ExpressionError("empty expression");
  }
  for (const auto& token : tokens) {
    if (token.kind == TokenKind::kComma) {
      throw ExpressionError("unexpected ',' outside a function call");
    }
    if (token.kind == TokenKind::kFunction) {
      throw ExpressionError("function " + token.text + " without an argument list");
    }
    if (token.kind == TokenKind::kLeftParen || token.kind == TokenKind::kRightParen) {
      throw ExpressionError("unbalanced parentheses");
    }
  }

  // NOT is right-associative: the last one binds first.
  while (const auto idx = find_last(tokens, TokenKind::kNot)) {
    const std::size_t i = *idx;
    if (i + 1 >= tokens.size() || tokens[i + 1].kind != TokenKind::kValue) {
      throw ExpressionError("NOT is missing an operand");
    }
    Value result = logical_not(tokens[i + 1].value);
    splice(tokens, i, i + 1, std::move(result));
  }

  fold_binary(tokens, TokenKind::kComparison, "comparison",
              [](const Token& op, const Value& l, const Value& r) {
                return compare(op.comparison, l, r);
              });
  fold_binary(tokens, TokenKind::kAnd, "AND",
              [](const Token&, const Value& l, const Value& r) { return logical_and(l, r); });
  fold_binary(tokens, TokenKind::kOr, "OR",
              [](const Token&, const Value& l, const Value& r) { return logical_or(l, r); });

  if (tokens.size() != 1 || tokens.front().kind != TokenKind::kValue) {
    throw ExpressionError("malformed expression: operands without an operator");
  }
  return tokens.front().value;
}

}  // namespace

Value ExpressionEvaluator::resolve_operand(const Token& token) const {
  if (auto literal = parse_literal(token.text)) {
    return std::move(*literal);
  }
  const auto it = variables_.find(token.text);
  if (it == variables_.end()) {
    return Value{};
  }
  return it->second;
}

Value ExpressionEvaluator::evaluate_tokens(std::vector<Token> tokens) const {
  for (auto& token : tokens) {
    if (token.kind == TokenKind::kOperand) {
      token.value = resolve_operand(token);
      token.kind = TokenKind::kValue;
    }
  }

  // Innermost group first: the last '(' has no '(' between it and its matching ')'.
  while (const auto open_idx = find_last(tokens, TokenKind::kLeftParen)) {
    const std::size_t open = *open_idx;
    std::size_t close = open + 1;
    while (close < tokens.size() && tokens[close].kind != TokenKind::kRightParen) {
      ++close;
    }
    if (close >= tokens.size()) {
      throw ExpressionError("unbalanced parentheses: missing ')'");
    }

    const TokenList inner(tokens.begin() + static_cast<std::ptrdiff_t>(open) + 1,
                          tokens.begin() + static_cast<std::ptrdiff_t>(close));

    if (open > 0 && tokens[open - 1].kind == TokenKind::kFunction) {
      std::vector<Value> args;
      for (auto& arg : split_arguments(inner)) {
        args.push_back(fold_flat(std::move(arg)));
      }
      Value result = call_function(tokens[open - 1].function, args);
      splice(tokens, open - 1, close, std::move(result));
    } else {
      if (inner.empty()) {
        throw ExpressionError("empty parentheses");
      }
      Value result = fold_flat(inner);
      splice(tokens, open, close, std::move(result));
    }
  }

  return fold_flat(std::move(tokens));
}

Value ExpressionEvaluator::evaluate_strict(std::string_view expression) const {
  return evaluate_tokens(tokenize(expression));
}

Value ExpressionEvaluator::evaluate_value(std::string_view expression) const {
  try {
    return evaluate_strict(expression);
  } catch (const ExpressionError& e) {
    core::log().warn("expression '{}' could not be evaluated: {}", expression, e.what());
  } catch (const std::exception& e) {
    core::log().warn("expression '{}' failed unexpectedly: {}", expression, e.what());
  }
  return Value{};
}

std::optional<bool> ExpressionEvaluator::evaluate(std::string_view expression) const {
  const Value result = evaluate_value(expression);
  if (const auto* b = std::get_if<bool>(&result)) {
    return *b;
  }
  if (is_null(result)) {
    return std::nullopt;
  }
  return truthy(result);
}

std::optional<bool> evaluate(std::string_view expression, const VariableEnvironment& variables) {
  const ExpressionEvaluator evaluator(variables);
  return evaluator.evaluate(expression);
}

std::set<std::string> referenced_identifiers(std::string_view expression) {
  std::set<std::string> identifiers;
  for (const auto& token : tokenize(expression)) {
    if (token.kind == TokenKind::kOperand && !parse_literal(token.text).has_value()) {
      identifiers.insert(token.text);
    }
  }
  return identifiers;
}

}  // namespace lexrisk::expression
