#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace rqcd::core {

// Byte-level text helpers shared by the lexicon, the tokenizers and the scorer.
// Only ASCII letters and digits count as word characters; every other byte,
// non-ASCII included, separates words. Nothing here consults the C locale.

[[nodiscard]] constexpr bool is_ascii_digit(const char ch) noexcept {
  return ch >= '0' && ch <= '9';
}

[[nodiscard]] constexpr bool is_ascii_alnum(const char ch) noexcept {
  const char folded = static_cast<char>(ch | 0x20);
  return is_ascii_digit(ch) || (folded >= 'a' && folded <= 'z');
}

[[nodiscard]] constexpr bool is_ascii_space(const char ch) noexcept {
  switch (ch) {
    case ' ':
    case '\t':
    case '\n':
    case '\r':
    case '\f':
    case '\v':
      return true;
    default:
      return false;
  }
}

// Same length as the input, so offsets into the result are offsets into the input.
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string lowered(input);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](const char ch) {
    return (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch;
  });
  return lowered;
}

// Lowercased alphanumeric runs of at least min_length bytes, in text order.
inline std::vector<std::string> tokenize_ascii(const std::string_view input,
                                               const std::size_t min_length = 2) {
  std::vector<std::string> tokens;
  std::size_t pos = 0;
  while (pos < input.size()) {
    while (pos < input.size() && !is_ascii_alnum(input[pos])) {
      ++pos;
    }
    const std::size_t begin = pos;
    while (pos < input.size() && is_ascii_alnum(input[pos])) {
      ++pos;
    }
    if (pos > begin && pos - begin >= min_length) {
      tokens.push_back(normalize_ascii_lower(input.substr(begin, pos - begin)));
    }
  }
  return tokens;
}

inline std::string trim(const std::string_view input) {
  const auto first = std::find_if_not(input.begin(), input.end(), is_ascii_space);
  const auto last = std::find_if_not(input.rbegin(), input.rend(), is_ascii_space).base();
  return first < last ? std::string(first, last) : std::string{};
}

[[nodiscard]] inline bool is_blank(const std::string_view input) noexcept {
  return std::all_of(input.begin(), input.end(), is_ascii_space);
}

inline std::string join(const std::vector<std::string>& parts, const std::string_view separator) {
  std::string out;
  bool first = true;
  for (const auto& part : parts) {
    if (!first) {
      out.append(separator);
    }
    out.append(part);
    first = false;
  }
  return out;
}

}  // namespace rqcd::core
