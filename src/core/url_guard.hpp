#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace core::security {

struct UrlVerdict {
  bool allowed = false;
  std::optional<std::string> reason;
};

// Scheme and hostname of a URL as written, without DNS resolution or
// numeric-host normalization. The hostname is lower-cased.
struct UrlTarget {
  std::string scheme;
  std::string hostname;
  std::string path;
};

// Returns std::nullopt for anything that does not parse as an absolute URL.
std::optional<UrlTarget> ParseUrlTarget(std::string_view url);

// Decides whether the server may fetch `url` on a caller's behalf. Checks the
// literal hostname only: a DNS name resolving to a private address passes.
UrlVerdict CheckUrl(std::string_view url);

}  // namespace core::security
