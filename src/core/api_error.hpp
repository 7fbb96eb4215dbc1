#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "nlohmann/json.hpp"

namespace core::api {

enum class ErrorCode {
  kMissingApiKey = 0,
  kForbiddenUrl,
  kTimeout,
  kNetworkError,
  kJsonParseError,
  kApiError,
};

std::string_view ToString(ErrorCode code);

struct ApiError {
  ErrorCode code = ErrorCode::kApiError;
  std::string message;
  // 0 when no HTTP status was ever received.
  int status = 0;
  // Code supplied by the remote API in its error body, if any.
  std::optional<std::string> remote_code;

  std::string CodeString() const;
};

// {"code": ..., "message": ..., "status": ...}
nlohmann::json ToJson(const ApiError& error);

}  // namespace core::api
