#include "lexrisk/citation/article_allowlist.h"

#include "lexrisk/core/logging.h"
#include "lexrisk/core/normalization.h"

#include <array>

namespace lexrisk::citation {

namespace {

// Lower-case spellings; ASCII letters in the input are folded before comparison.
// "artÍculo" covers the upper-case accented form, whose UTF-8 bytes differ from "í".
constexpr std::array<std::string_view, 4> kLongForms{
    "art\xc3\xad"
    "culo",
    "art\xc3\x8d"
    "culo",
    "articulo",
    "art",
};

bool is_word_char(const char ch) {
  return core::is_ascii_alpha(ch) || core::is_ascii_digit(ch) || ch == '_';
}

bool starts_with_folded(std::string_view text, std::size_t pos, std::string_view form) {
  if (pos + form.size() > text.size()) {
    return false;
  }
  for (std::size_t i = 0; i < form.size(); ++i) {
    if (core::ascii_lower(text[pos + i]) != form[i]) {
      return false;
    }
  }
  return true;
}

// Attempts a surface-form match at pos. On success returns the normalized number and sets
// `end` to one past the digit run.
std::optional<std::string> match_reference(std::string_view text, std::size_t pos,
                                           std::size_t& end) {
  if (pos > 0 && is_word_char(text[pos - 1])) {
    return std::nullopt;
  }

  for (const auto form : kLongForms) {
    if (!starts_with_folded(text, pos, form)) {
      continue;
    }
    std::size_t i = pos + form.size();
    if (form == "art" && i < text.size() && text[i] == '.') {
      ++i;
    }
    while (i < text.size() && core::is_ascii_space(text[i])) {
      ++i;
    }
    const std::size_t digits_begin = i;
    while (i < text.size() && core::is_ascii_digit(text[i])) {
      ++i;
    }
    if (i == digits_begin) {
      continue;
    }
    end = i;
    return core::strip_leading_zeros(text.substr(digits_begin, i - digits_begin));
  }
  return std::nullopt;
}

}  // namespace

ArticleSet extract_allowed_articles(std::string_view legal_context) {
  ArticleSet articles;
  std::size_t pos = 0;
  while (pos < legal_context.size()) {
    std::size_t end = pos;
    if (auto number = match_reference(legal_context, pos, end)) {
      articles.insert(std::move(*number));
      pos = end;
    } else {
      ++pos;
    }
  }
  return articles;
}

std::optional<std::string> normalize_article_reference(std::string_view text) {
  for (std::size_t pos = 0; pos < text.size(); ++pos) {
    std::size_t end = pos;
    if (auto number = match_reference(text, pos, end)) {
      return number;
    }
  }

  std::size_t first = 0;
  while (first < text.size() && !core::is_ascii_digit(text[first])) {
    ++first;
  }
  if (first == text.size()) {
    return std::nullopt;
  }
  std::size_t last = first;
  while (last < text.size() && core::is_ascii_digit(text[last])) {
    ++last;
  }
  return core::strip_leading_zeros(text.substr(first, last - first));
}

CitationFilterResult filter_legal_articles(const std::vector<std::string>& citations,
                                           const ArticleSet& allowed,
                                           std::string_view legal_context) {
  CitationFilterResult result;
  for (const auto& citation : citations) {
    const auto number = normalize_article_reference(citation);
    if (number.has_value() && allowed.count(*number) > 0) {
      result.valid.push_back(citation);
      continue;
    }
    core::log().warn(
        "citation '{}' discarded: article {} not present in legal context ({} bytes, {} "
        "allowed article(s))",
        citation, number.value_or("<none>"), legal_context.size(), allowed.size());
    result.discarded.push_back(citation);
  }
  return result;
}

}  // namespace lexrisk::citation
