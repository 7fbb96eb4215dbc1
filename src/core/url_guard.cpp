#include "core/url_guard.hpp"

#include <array>
#include <cctype>
#include <string>
#include <vector>

namespace core::security {
namespace {

constexpr std::array<std::string_view, 5> kLocalhostNames = {
    "localhost", "127.0.0.1", "0.0.0.0", "::1", "[::1]"};

constexpr std::array<std::string_view, 3> kMetadataHosts = {
    "169.254.169.254", "metadata.google.internal", "metadata.goog"};

bool IsDigit(char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; }

bool IsHexDigit(char ch) { return std::isxdigit(static_cast<unsigned char>(ch)) != 0; }

std::string ToLower(std::string_view value) {
  std::string lowered(value);
  for (auto& ch : lowered) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return lowered;
}

// The fetch hands the raw string to the transport, so nothing is stripped
// here: any control character or space makes the URL unusable.
bool HasUrlNoise(std::string_view url) {
  for (char ch : url) {
    const auto byte = static_cast<unsigned char>(ch);
    if (byte <= 0x20 || byte == 0x7f) {
      return true;
    }
  }
  return false;
}

bool IsForbiddenHostChar(char ch) {
  const auto byte = static_cast<unsigned char>(ch);
  if (byte <= 0x20 || byte == 0x7f) {
    return true;
  }
  switch (ch) {
    case '#':
    case '%':
    case '/':
    case '<':
    case '>':
    case '?':
    case '@':
    case '[':
    case '\\':
    case ']':
    case '^':
    case '|':
    case '"':
      return true;
    default:
      return false;
  }
}

bool IsValidPort(std::string_view port) {
  if (port.size() > 5) {
    return false;
  }
  for (char ch : port) {
    if (!IsDigit(ch)) {
      return false;
    }
  }
  return port.empty() || std::stoi(std::string(port)) <= 65535;
}

bool AllDigits(std::string_view value) {
  if (value.empty()) {
    return false;
  }
  for (char ch : value) {
    if (!IsDigit(ch)) {
      return false;
    }
  }
  return true;
}

// Decimal-integer (2130706433), hex (0x7f000001, 0x7f.0.0.1) and octal
// (0177.0.0.1) spellings of an IPv4 address. Any host starting with "0x" or
// with '0' and another digit is refused, even when it is a DNS name.
bool IsAlternateNumericHost(std::string_view host) {
  if (AllDigits(host)) {
    return true;
  }
  if (host.size() > 1 && host[0] == '0' && (host[1] == 'x' || host[1] == 'X')) {
    return true;
  }
  return host.size() > 1 && host[0] == '0' && IsDigit(host[1]);
}

std::optional<std::array<int, 4>> ParseDottedQuad(std::string_view host) {
  std::array<int, 4> octets{};
  std::size_t index = 0;
  std::size_t start = 0;
  while (true) {
    const auto dot = host.find('.', start);
    const auto part = host.substr(start, dot == std::string_view::npos ? host.size() - start
                                                                       : dot - start);
    if (index >= octets.size() || part.empty() || part.size() > 3 || !AllDigits(part)) {
      return std::nullopt;
    }
    const int value = std::stoi(std::string(part));
    if (value > 255) {
      return std::nullopt;
    }
    octets[index++] = value;
    if (dot == std::string_view::npos) {
      break;
    }
    start = dot + 1;
  }
  if (index != octets.size()) {
    return std::nullopt;
  }
  return octets;
}

UrlVerdict Deny(std::string reason) { return UrlVerdict{false, std::move(reason)}; }

}  // namespace

std::optional<UrlTarget> ParseUrlTarget(std::string_view raw_url) {
  if (HasUrlNoise(raw_url)) {
    return std::nullopt;
  }
  const std::string url(raw_url);
  const auto colon = url.find(':');
  if (colon == std::string::npos || colon == 0 ||
      !std::isalpha(static_cast<unsigned char>(url[0]))) {
    return std::nullopt;
  }
  for (std::size_t i = 1; i < colon; ++i) {
    const char ch = url[i];
    if (!std::isalnum(static_cast<unsigned char>(ch)) && ch != '+' && ch != '-' && ch != '.') {
      return std::nullopt;
    }
  }

  UrlTarget target;
  target.scheme = ToLower(std::string_view(url).substr(0, colon));
  if (target.scheme != "http" && target.scheme != "https") {
    // Other schemes are recognised but rejected later; no host parsing.
    return target;
  }

  // Only the "scheme://authority" spelling the transport understands.
  if (url.compare(colon, 3, "://") != 0) {
    return std::nullopt;
  }
  const std::size_t pos = colon + 3;
  const auto authority_end = url.find_first_of("/?#", pos);
  std::string authority = url.substr(pos, authority_end == std::string::npos
                                              ? std::string::npos
                                              : authority_end - pos);
  if (authority_end != std::string::npos) {
    target.path = url.substr(authority_end);
    const auto suffix = target.path.find_first_of("?#");
    if (suffix != std::string::npos) {
      target.path.erase(suffix);
    }
  }
  // A backslash here is read as a path start by browsers but not by the
  // transport; the two would disagree on the host.
  if (authority.find('\\') != std::string::npos) {
    return std::nullopt;
  }
  if (const auto at = authority.rfind('@'); at != std::string::npos) {
    authority.erase(0, at + 1);
  }
  if (authority.empty()) {
    return std::nullopt;
  }

  std::string host;
  std::string_view port;
  if (authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string::npos || close == 1) {
      return std::nullopt;
    }
    for (std::size_t i = 1; i < close; ++i) {
      const char ch = authority[i];
      if (!IsHexDigit(ch) && ch != ':' && ch != '.') {
        return std::nullopt;
      }
    }
    host = authority.substr(0, close + 1);
    const std::string_view rest = std::string_view(authority).substr(close + 1);
    if (!rest.empty()) {
      if (rest.front() != ':') {
        return std::nullopt;
      }
      port = rest.substr(1);
    }
  } else {
    const auto port_sep = authority.find(':');
    host = authority.substr(0, port_sep);
    if (port_sep != std::string::npos) {
      port = std::string_view(authority).substr(port_sep + 1);
    }
    for (char ch : host) {
      if (IsForbiddenHostChar(ch)) {
        return std::nullopt;
      }
    }
    // "example.com." and "example.com" name the same host.
    if (host.size() > 1 && host.back() == '.') {
      host.pop_back();
    }
  }
  if (host.empty() || host == "." || !IsValidPort(port)) {
    return std::nullopt;
  }

  target.hostname = ToLower(host);
  if (target.path.empty()) {
    target.path = "/";
  }
  return target;
}

UrlVerdict CheckUrl(std::string_view url) {
  const auto parsed = ParseUrlTarget(url);
  if (!parsed) {
    return Deny("Invalid URL format");
  }

  if (parsed->scheme != "http" && parsed->scheme != "https") {
    return Deny("Protocol '" + parsed->scheme + ":' is not allowed");
  }

  const std::string& hostname = parsed->hostname;
  for (const auto name : kLocalhostNames) {
    if (hostname == name) {
      return Deny("Localhost URLs are not allowed");
    }
  }
  for (const auto name : kMetadataHosts) {
    if (hostname == name) {
      return Deny("Cloud metadata endpoints are not allowed");
    }
  }

  // Covers IPv4-mapped forms such as [::ffff:127.0.0.1].
  if (hostname.find(':') != std::string::npos) {
    return Deny("IPv6 addresses are not allowed");
  }

  // Must precede the dotted-quad check: 0177.0.0.1 parses as 177.0.0.1.
  if (IsAlternateNumericHost(hostname)) {
    return Deny("Numeric IP representations are not allowed");
  }

  if (const auto octets = ParseDottedQuad(hostname)) {
    const int a = (*octets)[0];
    const int b = (*octets)[1];
    if (a == 10 || (a == 172 && b >= 16 && b <= 31) || (a == 192 && b == 168)) {
      return Deny("Private network URLs are not allowed");
    }
    if (a == 169 && b == 254) {
      return Deny("Link-local URLs are not allowed");
    }
  }

  return UrlVerdict{true, std::nullopt};
}

}  // namespace core::security
