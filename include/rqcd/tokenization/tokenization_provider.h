#pragma once

#include "rqcd/core/result.h"

#include <string>
#include <string_view>
#include <vector>

namespace rqcd::tokenization {

/// Interface for word-level tokenizers used by the complexity check.
///
/// Lifecycle: prepare() is called once, eagerly, before the first tokenize().
/// Implementations that need data files load them in prepare() and cache the
/// outcome, so repeated calls return the first result without redoing work.
/// tokenize() must be deterministic and must not touch the network.
class ITokenizationProvider {
 public:
  virtual ~ITokenizationProvider() = default;

  /// Stable identifier reported alongside results ("word-v1", "whitespace-v1").
  [[nodiscard]] virtual std::string_view id() const noexcept = 0;

  /// One-time resource setup.
  /// @return true on success, or a diagnostic describing the missing resource
  [[nodiscard]] virtual core::Result<bool, std::string> prepare() = 0;

  /// Split text into word-level tokens, in text order, original case.
  [[nodiscard]] virtual std::vector<std::string> tokenize(std::string_view text) const = 0;

 protected:
  ITokenizationProvider() = default;
  ITokenizationProvider(const ITokenizationProvider&) = default;
  ITokenizationProvider& operator=(const ITokenizationProvider&) = default;
  ITokenizationProvider(ITokenizationProvider&&) = default;
  ITokenizationProvider& operator=(ITokenizationProvider&&) = default;
};

}  // namespace rqcd::tokenization
