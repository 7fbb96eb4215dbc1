#include "core/config.hpp"

#include <cstdlib>
#include <exception>
#include <string>

#include "core/logging.hpp"

namespace core {

using core::logging::LogWarn;

ClientConfig LoadClientConfig() {
  ClientConfig config;
  if (const char* key = std::getenv("IMG_SRC_API_KEY")) {
    if (*key != '\0') {
      config.api_key = std::string{key};
    }
  }
  if (const char* url = std::getenv("IMG_SRC_API_URL")) {
    std::string value = url;
    while (!value.empty() && value.back() == '/') {
      value.pop_back();
    }
    if (!value.empty()) {
      config.api_base_url = value;
    }
  }
  if (const char* timeout = std::getenv("IMG_SRC_TIMEOUT_MS")) {
    try {
      const long parsed = std::stol(timeout);
      if (parsed > 0) {
        config.request_timeout = std::chrono::milliseconds(parsed);
      } else {
        LogWarn("IMG_SRC_TIMEOUT_MS must be positive, falling back to default 30000");
      }
    } catch (const std::exception& ex) {
      LogWarn(std::string{"Failed to parse IMG_SRC_TIMEOUT_MS: "} + ex.what());
    }
  }
  return config;
}

}  // namespace core
