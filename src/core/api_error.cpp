#include "core/api_error.hpp"

namespace core::api {

std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kMissingApiKey:
      return "MISSING_API_KEY";
    case ErrorCode::kForbiddenUrl:
      return "FORBIDDEN_URL";
    case ErrorCode::kTimeout:
      return "TIMEOUT";
    case ErrorCode::kNetworkError:
      return "NETWORK_ERROR";
    case ErrorCode::kJsonParseError:
      return "JSON_PARSE_ERROR";
    case ErrorCode::kApiError:
      return "API_ERROR";
  }
  return "API_ERROR";
}

std::string ApiError::CodeString() const {
  if (remote_code && !remote_code->empty()) {
    return *remote_code;
  }
  return std::string{ToString(code)};
}

nlohmann::json ToJson(const ApiError& error) {
  return {{"code", error.CodeString()}, {"message", error.message}, {"status", error.status}};
}

}  // namespace core::api
