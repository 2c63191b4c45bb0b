#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace lexrisk::citation {

// Article identifiers are decimal numbers without leading zeros, e.g. "5", "165".
using ArticleSet = std::set<std::string>;

// extract_allowed_articles scans retrieved legal text for article references.
// Recognised surface forms, case-insensitive and only at the start of a word:
//   "Art 5", "Art. 5", "Art.5", "ART 5", "Artículo 5", "ARTÍCULO 5", "Articulo 5".
// Returns the set of article numbers found. Empty text yields an empty set.
[[nodiscard]] ArticleSet extract_allowed_articles(std::string_view legal_context);

// normalize_article_reference maps a citation string to the same identifier space.
// The first recognised surface form wins; otherwise the first bare digit run is used.
// Returns nullopt when the text contains no number.
[[nodiscard]] std::optional<std::string> normalize_article_reference(std::string_view text);

struct CitationFilterResult {
  std::vector<std::string> valid;      // NOLINT(readability-identifier-naming)
  std::vector<std::string> discarded;  // NOLINT(readability-identifier-naming)
};

// filter_legal_articles partitions citations into those whose normalized number is in `allowed`
// and those that are not (including citations with no number). Both lists keep input order and
// the original citation spelling. Every discarded citation is logged at warning level;
// legal_context is used for the log message only.
[[nodiscard]] CitationFilterResult filter_legal_articles(const std::vector<std::string>& citations,
                                                         const ArticleSet& allowed,
                                                         std::string_view legal_context);

}  // namespace lexrisk::citation
