#pragma once

#include <string>
#include <string_view>

namespace lexrisk::core {

// Deterministic ASCII-only helpers. Locale-independent by construction: no std::tolower,
// no std::isalpha, so rule text and legal context scan identically on every platform.
// Bytes outside ASCII (UTF-8 continuation bytes included) are passed through untouched.

constexpr bool is_ascii_digit(const char ch) noexcept { return ch >= '0' && ch <= '9'; }

constexpr bool is_ascii_alpha(const char ch) noexcept {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

constexpr bool is_ascii_space(const char ch) noexcept {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

constexpr char ascii_lower(const char ch) noexcept {
  constexpr char kCaseOffset = 'a' - 'A';
  return (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch + kCaseOffset) : ch;
}

inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());
  for (const char ch : input) {
    result.push_back(ascii_lower(ch));
  }
  return result;
}

// trim removes leading and trailing ASCII whitespace.
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }
  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }
  return std::string{input.substr(start, end - start)};
}

// strip_leading_zeros("007") == "7"; an all-zero run keeps a single "0".
inline std::string strip_leading_zeros(const std::string_view digits) {
  std::size_t first = 0;
  while (first + 1 < digits.size() && digits[first] == '0') {
    ++first;
  }
  return std::string{digits.substr(first)};
}

}  // namespace lexrisk::core
