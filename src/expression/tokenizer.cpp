#include "lexrisk/core/normalization.h"
#include "lexrisk/expression/token.h"

#include <charconv>

namespace lexrisk::expression {

namespace {

Token make_token(TokenKind kind, std::string text) {
  Token token;
  token.kind = kind;
  token.text = std::move(text);
  return token;
}

Token classify_word(std::string word) {
  if (word == "AND") {
    return make_token(TokenKind::kAnd, std::move(word));
  }
  if (word == "OR") {
    return make_token(TokenKind::kOr, std::move(word));
  }
  if (word == "NOT") {
    return make_token(TokenKind::kNot, std::move(word));
  }

  Token token = make_token(TokenKind::kFunction, word);
  if (word == "MIN") {
    token.function = Function::kMin;
  } else if (word == "MAX") {
    token.function = Function::kMax;
  } else if (word == "COUNT") {
    token.function = Function::kCount;
  } else if (word == "SUM") {
    token.function = Function::kSum;
  } else {
    token.kind = TokenKind::kOperand;
  }
  return token;
}

constexpr bool is_operator_char(const char ch) noexcept {
  return ch == '=' || ch == '!' || ch == '<' || ch == '>';
}

// Numeric spelling: optional leading '-', digits, at most one '.', at least one digit.
bool looks_numeric(std::string_view spelling, bool& has_dot) {
  has_dot = false;
  std::size_t i = 0;
  if (!spelling.empty() && spelling[0] == '-') {
    i = 1;
  }
  bool has_digit = false;
  for (; i < spelling.size(); ++i) {
    const char ch = spelling[i];
    if (core::is_ascii_digit(ch)) {
      has_digit = true;
    } else if (ch == '.' && !has_dot) {
      has_dot = true;
    } else {
      return false;
    }
  }
  return has_digit;
}

}  // namespace

std::optional<Value> parse_literal(std::string_view spelling) {
  if (spelling == "true" || spelling == "True") {
    return Value{true};
  }
  if (spelling == "false" || spelling == "False") {
    return Value{false};
  }
  if (spelling == "null") {
    return Value{};
  }

  bool has_dot = false;
  if (!looks_numeric(spelling, has_dot)) {
    return std::nullopt;
  }

  const char* first = spelling.data();
  const char* last = spelling.data() + spelling.size();
  if (!has_dot) {
    std::int64_t integer = 0;
    const auto [end, ec] = std::from_chars(first, last, integer);
    if (ec == std::errc{} && end == last) {
      return Value{integer};
    }
    // Out of int64 range: fall through and keep it as a decimal.
  }

  double decimal = 0.0;
  const auto [end, ec] = std::from_chars(first, last, decimal);
  if (ec != std::errc{} || end != last) {
    throw ExpressionError("invalid numeric literal '" + std::string(spelling) + "'");
  }
  return Value{decimal};
}

std::vector<Token> tokenize(std::string_view expression) {
  std::vector<Token> tokens;
  std::string word;

  const auto flush_word = [&tokens, &word]() {
    if (!word.empty()) {
      tokens.push_back(classify_word(std::move(word)));
      word.clear();
    }
  };

  std::size_t i = 0;
  while (i < expression.size()) {
    const char ch = expression[i];

    if (core::is_ascii_space(ch)) {
      flush_word();
      ++i;
    } else if (ch == '(' || ch == ')' || ch == ',') {
      flush_word();
      const TokenKind kind = ch == '('   ? TokenKind::kLeftParen
                             : ch == ')' ? TokenKind::kRightParen
                                         : TokenKind::kComma;
      tokens.push_back(make_token(kind, std::string(1, ch)));
      ++i;
    } else if (ch == '"' || ch == '\'') {
      flush_word();
      const std::size_t close = expression.find(ch, i + 1);
      if (close == std::string_view::npos) {
        throw ExpressionError("unterminated string literal at offset " + std::to_string(i));
      }
      Token token = make_token(TokenKind::kValue, std::string(expression.substr(i, close - i + 1)));
      token.value = std::string(expression.substr(i + 1, close - i - 1));
      tokens.push_back(std::move(token));
      i = close + 1;
    } else if (is_operator_char(ch)) {
      flush_word();
      const bool followed_by_equals = i + 1 < expression.size() && expression[i + 1] == '=';
      Token token = make_token(TokenKind::kComparison, "");
      if (followed_by_equals) {
        token.text = std::string(expression.substr(i, 2));
        token.comparison = ch == '='   ? Comparison::kEqual
                           : ch == '!' ? Comparison::kNotEqual
                           : ch == '>' ? Comparison::kGreaterEqual
                                       : Comparison::kLessEqual;
        i += 2;
      } else if (ch == '>' || ch == '<') {
        token.text = std::string(1, ch);
        token.comparison = ch == '>' ? Comparison::kGreater : Comparison::kLess;
        i += 1;
      } else {
        throw ExpressionError("unexpected '" + std::string(1, ch) + "' at offset " +
                              std::to_string(i));
      }
      tokens.push_back(std::move(token));
    } else {
      word.push_back(ch);
      ++i;
    }
  }
  flush_word();

  return tokens;
}

}  // namespace lexrisk::expression
