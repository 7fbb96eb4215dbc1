#include "core/path_sanitizer.hpp"

#include <cctype>
#include <vector>

namespace core::security {
namespace {

int HexValue(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

bool IsValidUtf8(std::string_view bytes) {
  std::size_t i = 0;
  while (i < bytes.size()) {
    const auto lead = static_cast<unsigned char>(bytes[i]);
    std::size_t length = 0;
    unsigned int code_point = 0;
    if (lead < 0x80) {
      ++i;
      continue;
    }
    if ((lead & 0xE0) == 0xC0) {
      length = 2;
      code_point = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      length = 3;
      code_point = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      length = 4;
      code_point = lead & 0x07;
    } else {
      return false;
    }
    if (i + length > bytes.size()) {
      return false;
    }
    for (std::size_t k = 1; k < length; ++k) {
      const auto next = static_cast<unsigned char>(bytes[i + k]);
      if ((next & 0xC0) != 0x80) {
        return false;
      }
      code_point = (code_point << 6) | (next & 0x3F);
    }
    // Overlong forms, surrogates and values past U+10FFFF.
    if ((length == 2 && code_point < 0x80) || (length == 3 && code_point < 0x800) ||
        (length == 4 && code_point < 0x10000) || code_point > 0x10FFFF ||
        (code_point >= 0xD800 && code_point <= 0xDFFF)) {
      return false;
    }
    i += length;
  }
  return true;
}

// Decodes until nothing changes, so a double-encoded "%252e%252e" cannot
// survive one pass and turn into ".." on the next.
std::string DecodeFully(std::string_view path) {
  std::string current(path);
  while (current.find('%') != std::string::npos) {
    auto decoded = PercentDecode(current);
    if (!decoded || *decoded == current) {
      break;
    }
    current = std::move(*decoded);
  }
  return current;
}

}  // namespace

std::optional<std::string> PercentDecode(std::string_view value) {
  std::string decoded;
  decoded.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] != '%') {
      decoded.push_back(value[i]);
      continue;
    }
    if (i + 2 >= value.size()) {
      return std::nullopt;
    }
    const int high = HexValue(value[i + 1]);
    const int low = HexValue(value[i + 2]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<char>((high << 4) | low));
    i += 2;
  }
  if (!IsValidUtf8(decoded)) {
    return std::nullopt;
  }
  return decoded;
}

std::string SanitizePath(std::string_view path) {
  const std::string decoded = DecodeFully(path);

  std::vector<std::string_view> segments;
  const std::string_view view(decoded);
  std::size_t start = 0;
  while (start <= view.size()) {
    const auto sep = view.find_first_of("/\\", start);
    const auto segment =
        view.substr(start, sep == std::string_view::npos ? view.size() - start : sep - start);
    if (!segment.empty() && segment != "." && segment != "..") {
      segments.push_back(segment);
    }
    if (sep == std::string_view::npos) {
      break;
    }
    start = sep + 1;
  }

  std::string sanitized;
  for (const auto segment : segments) {
    if (!sanitized.empty()) {
      sanitized.push_back('/');
    }
    sanitized.append(segment);
  }
  return sanitized;
}

std::string SanitizeUsername(std::string_view username) {
  std::string sanitized;
  for (char ch : username) {
    if (std::isalnum(static_cast<unsigned char>(ch)) || ch == '_' || ch == '-') {
      sanitized.push_back(ch);
    }
  }
  return sanitized;
}

}  // namespace core::security
