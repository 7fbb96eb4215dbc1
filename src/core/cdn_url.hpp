#pragma once

#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace core {

struct CdnUrlRequest {
  std::string username;
  std::string filepath;
  std::optional<int> width;
  std::optional<int> height;
  std::optional<std::string> fit;
  std::optional<int> quality;
  std::optional<std::string> format;
};

// Builds <cdn_base>/i/<user>/<path without last extension>.<format>?w=&h=&fit=&q=
// from sanitized inputs. Returns an INVALID_USERNAME error payload when
// nothing of the username survives sanitization. No I/O.
nlohmann::json BuildCdnUrl(const std::string& cdn_base_url, const CdnUrlRequest& request);

}  // namespace core
