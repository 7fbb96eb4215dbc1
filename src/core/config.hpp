#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace core {

// Process-wide client settings. Built once in main() and passed by const
// reference; nothing mutates it afterwards.
struct ClientConfig {
  std::string api_base_url = "https://api.img-src.io";
  std::optional<std::string> api_key;
  std::chrono::milliseconds request_timeout{30000};
  std::size_t max_image_bytes = 5 * 1024 * 1024;
  std::string cdn_base_url = "https://img-src.io";
};

ClientConfig LoadClientConfig();

}  // namespace core
