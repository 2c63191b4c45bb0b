#include "lexrisk/expression/token.h"

#include <catch2/catch.hpp>

#include <vector>

using namespace lexrisk::expression;

namespace {

std::vector<TokenKind> kinds_of(const std::vector<Token>& tokens) {
  std::vector<TokenKind> kinds;
  kinds.reserve(tokens.size());
  for (const auto& token : tokens) {
    kinds.push_back(token.kind);
  }
  return kinds;
}

}  // namespace

TEST_CASE("Tokenizer splits comparisons and logical keywords", "[expression][tokenizer]") {
  SECTION("comparison between identifier and literal") {
    const auto tokens = tokenize("ratio_liquidez < 1.0");
    REQUIRE(tokens.size() == 3);
    CHECK(tokens[0].kind == TokenKind::kOperand);
    CHECK(tokens[0].text == "ratio_liquidez");
    CHECK(tokens[1].kind == TokenKind::kComparison);
    CHECK(tokens[1].comparison == Comparison::kLess);
    CHECK(tokens[2].kind == TokenKind::kOperand);
    CHECK(tokens[2].text == "1.0");
  }

  SECTION("two-character operators are recognised") {
    const auto tokens = tokenize("a>=1 AND b<=2 OR c!=3 AND d==4");
    const std::vector<TokenKind> expected = {
        TokenKind::kOperand, TokenKind::kComparison, TokenKind::kOperand, TokenKind::kAnd,
        TokenKind::kOperand, TokenKind::kComparison, TokenKind::kOperand, TokenKind::kOr,
        TokenKind::kOperand, TokenKind::kComparison, TokenKind::kOperand, TokenKind::kAnd,
        TokenKind::kOperand, TokenKind::kComparison, TokenKind::kOperand,
    };
    REQUIRE(kinds_of(tokens) == expected);
    CHECK(tokens[1].comparison == Comparison::kGreaterEqual);
    CHECK(tokens[5].comparison == Comparison::kLessEqual);
    CHECK(tokens[9].comparison == Comparison::kNotEqual);
    CHECK(tokens[13].comparison == Comparison::kEqual);
  }

  SECTION("keywords inside identifiers are not split") {
    const auto tokens = tokenize("BRAND == ORDEN");
    REQUIRE(tokens.size() == 3);
    CHECK(tokens[0].kind == TokenKind::kOperand);
    CHECK(tokens[0].text == "BRAND");
    CHECK(tokens[2].kind == TokenKind::kOperand);
    CHECK(tokens[2].text == "ORDEN");
  }

  SECTION("NOT is a prefix keyword") {
    const auto tokens = tokenize("NOT contabilidad_irregular");
    REQUIRE(kinds_of(tokens) == std::vector<TokenKind>{TokenKind::kNot, TokenKind::kOperand});
  }
}

TEST_CASE("Tokenizer handles function calls and string literals", "[expression][tokenizer]") {
  SECTION("function call with arguments") {
    const auto tokens = tokenize("MAX(a, b)");
    const std::vector<TokenKind> expected = {
        TokenKind::kFunction, TokenKind::kLeftParen, TokenKind::kOperand,
        TokenKind::kComma,    TokenKind::kOperand,   TokenKind::kRightParen,
    };
    REQUIRE(kinds_of(tokens) == expected);
    CHECK(tokens[0].function == Function::kMax);
  }

  SECTION("quoted strings keep inner spaces and either quote style") {
    const auto double_quoted = tokenize("estado == \"en liquidacion\"");
    REQUIRE(double_quoted.size() == 3);
    CHECK(double_quoted[2].kind == TokenKind::kValue);
    CHECK(std::get<std::string>(double_quoted[2].value) == "en liquidacion");

    const auto single_quoted = tokenize("estado == 'concurso'");
    REQUIRE(single_quoted.size() == 3);
    CHECK(std::get<std::string>(single_quoted[2].value) == "concurso");
  }

  SECTION("empty input yields no tokens") {
    CHECK(tokenize("").empty());
    CHECK(tokenize("   ").empty());
  }
}

TEST_CASE("Tokenizer rejects malformed input", "[expression][tokenizer]") {
  CHECK_THROWS_AS(tokenize("estado == \"abierto"), ExpressionError);
  CHECK_THROWS_AS(tokenize("a = 1"), ExpressionError);
  CHECK_THROWS_AS(tokenize("!a"), ExpressionError);
}

TEST_CASE("Literal parsing", "[expression][tokenizer]") {
  SECTION("integers stay integral") {
    const auto value = parse_literal("42");
    REQUIRE(value.has_value());
    REQUIRE(std::holds_alternative<std::int64_t>(*value));
    CHECK(std::get<std::int64_t>(*value) == 42);

    const auto negative = parse_literal("-3");
    REQUIRE(negative.has_value());
    CHECK(std::get<std::int64_t>(*negative) == -3);
  }

  SECTION("decimals become double") {
    const auto value = parse_literal("2.5");
    REQUIRE(value.has_value());
    REQUIRE(std::holds_alternative<double>(*value));
    CHECK(std::get<double>(*value) == 2.5);
  }

  SECTION("booleans and null") {
    CHECK(std::get<bool>(*parse_literal("true")));
    CHECK(std::get<bool>(*parse_literal("True")));
    CHECK_FALSE(std::get<bool>(*parse_literal("false")));
    const auto null_value = parse_literal("null");
    REQUIRE(null_value.has_value());
    CHECK(is_null(*null_value));
  }

  SECTION("identifiers are not literals") {
    CHECK_FALSE(parse_literal("deuda_vencida").has_value());
    CHECK_FALSE(parse_literal("1.2.3").has_value());
    CHECK_FALSE(parse_literal("-").has_value());
  }
}
