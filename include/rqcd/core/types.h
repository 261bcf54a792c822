#pragma once

#include <cstddef>

namespace rqcd::core {

// TextSpan is a half-open byte range [begin, end) into an analyzed statement.
struct TextSpan {
  std::size_t begin{0};  // NOLINT(readability-identifier-naming)
  std::size_t end{0};    // NOLINT(readability-identifier-naming)

  [[nodiscard]] std::size_t length() const noexcept { return end - begin; }
  bool operator==(const TextSpan&) const = default;
};

}  // namespace rqcd::core
