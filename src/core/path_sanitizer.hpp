#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace core::security {

// Decodes %XX escapes. Returns std::nullopt when an escape is malformed or
// the decoded bytes are not valid UTF-8.
std::optional<std::string> PercentDecode(std::string_view value);

// Normalizes a caller-supplied storage path. Escapes are decoded repeatedly
// until the string stops changing, so "%252e%252e" ends up as "..". A
// malformed escape or invalid UTF-8 stops decoding at the previous round.
// The path is then split on runs of '/' and '\'. "", "." and ".." segments
// are dropped and the rest is joined with '/'. Never fails; the result has
// no leading separator.
std::string SanitizePath(std::string_view path);

// Keeps only [A-Za-z0-9_-].
std::string SanitizeUsername(std::string_view username);

}  // namespace core::security
