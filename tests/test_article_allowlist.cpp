#include "lexrisk/citation/article_allowlist.h"

#include <catch2/catch.hpp>

using namespace lexrisk::citation;

TEST_CASE("Allowed articles are extracted from the legal context", "[citation]") {
  SECTION("all surface forms are recognised") {
    const auto articles = extract_allowed_articles(
        "Según el Art. 5 y el artículo 443, así como ART 2, el Art.165 y el Articulo 7.");
    CHECK(articles == ArticleSet{"5", "443", "2", "165", "7"});
  }

  SECTION("upper-case accented form and leading zeros") {
    CHECK(extract_allowed_articles("ARTÍCULO 0226 del TRLC") == ArticleSet{"226"});
  }

  SECTION("matches start at a word boundary") {
    CHECK(extract_allowed_articles("la parte 5 del contrato").empty());
    CHECK(extract_allowed_articles("Arte 5").empty());
    CHECK(extract_allowed_articles("smart 12").empty());
  }

  SECTION("context without references") {
    CHECK(extract_allowed_articles("").empty());
    CHECK(extract_allowed_articles("Texto sin referencias normativas.").empty());
  }
}

TEST_CASE("Citations normalize to their article number", "[citation]") {
  CHECK(normalize_article_reference("Art. 5 TRLC") == "5");
  CHECK(normalize_article_reference("Artículo 443") == "443");
  CHECK(normalize_article_reference("Art. 007") == "7");
  CHECK(normalize_article_reference("TRLC 226") == "226");
  CHECK_FALSE(normalize_article_reference("Disposición adicional").has_value());
}

TEST_CASE("Citations are filtered through the allow-list", "[citation]") {
  const std::string context = "El Art. 5 TRLC regula el deber de solicitar el concurso.";
  const auto allowed = extract_allowed_articles(context);

  const auto result = filter_legal_articles(
      {"Art. 5 TRLC", "Art. 99 TRLC", "Disposición adicional", "artículo 5"}, allowed, context);

  CHECK(result.valid == std::vector<std::string>{"Art. 5 TRLC", "artículo 5"});
  CHECK(result.discarded == std::vector<std::string>{"Art. 99 TRLC", "Disposición adicional"});
}

TEST_CASE("An empty context discards every citation", "[citation]") {
  const auto result = filter_legal_articles({"Art. 2 TRLC", "Art. 5 TRLC"}, ArticleSet{}, "");
  CHECK(result.valid.empty());
  CHECK(result.discarded.size() == 2);
}
