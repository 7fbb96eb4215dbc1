#include "core/request_client.hpp"

#include <exception>
#include <utility>

#include "core/logging.hpp"
#include "platform/cancellation.hpp"

namespace core::api {
namespace {

using core::logging::LogDebug;
using core::logging::LogWarn;

RequestOutcome<nlohmann::json> Fail(ErrorCode code, std::string message, int status,
                                    std::optional<std::string> remote_code = std::nullopt) {
  return RequestOutcome<nlohmann::json>::Failure(
      ApiError{code, std::move(message), status, std::move(remote_code)});
}

// Error bodies are not guaranteed to follow {"error": {"code", "message"}};
// anything missing falls back to the generic API_ERROR description.
ApiError DecodeErrorBody(const nlohmann::json& body, int status) {
  ApiError error{ErrorCode::kApiError,
                 "API request failed with status " + std::to_string(status), status,
                 std::nullopt};
  if (!body.is_object()) {
    return error;
  }
  const auto it = body.find("error");
  if (it == body.end() || !it->is_object()) {
    return error;
  }
  if (const auto code = it->find("code"); code != it->end() && code->is_string()) {
    error.remote_code = code->get<std::string>();
  }
  if (const auto message = it->find("message"); message != it->end() && message->is_string()) {
    error.message = message->get<std::string>();
  }
  return error;
}

bool IsSuccessStatus(int status) { return status >= 200 && status < 300; }

}  // namespace

std::string DescribeTimeout(std::chrono::milliseconds timeout) {
  const auto count = timeout.count();
  if (count % 1000 == 0) {
    return std::to_string(count / 1000) + " seconds";
  }
  return std::to_string(count) + " ms";
}

RequestClient::RequestClient(const ClientConfig& config, platform::Transport& transport)
    : config_(config), transport_(transport) {}

RequestOutcome<nlohmann::json> RequestClient::Send(const std::string& method,
                                                   const std::string& path,
                                                   const std::optional<nlohmann::json>& body) const {
  platform::HttpClientRequest request;
  request.headers["Content-Type"] = "application/json";
  if (body) {
    request.body = body->dump();
  }
  int status = 0;
  return Execute(method, path, std::move(request), status);
}

RequestOutcome<nlohmann::json> RequestClient::SendMultipart(
    const std::string& method, const std::string& path,
    std::vector<platform::MultipartPart> parts) const {
  platform::HttpClientRequest request;
  request.multipart = std::move(parts);
  int status = 0;
  return Execute(method, path, std::move(request), status);
}

RequestOutcome<nlohmann::json> RequestClient::Execute(const std::string& method,
                                                      const std::string& path,
                                                      platform::HttpClientRequest request,
                                                      int& status) const {
  if (!config_.api_key) {
    LogWarn(method + " " + path + " skipped: no API key configured");
    return Fail(ErrorCode::kMissingApiKey,
                "IMG_SRC_API_KEY environment variable is not set. Please set it to your "
                "img-src.io API key.",
                401);
  }

  request.method = method;
  request.url = config_.api_base_url + path;
  request.timeout = config_.request_timeout + kSocketTimeoutSlack;
  request.headers["Authorization"] = "Bearer " + *config_.api_key;
  request.headers["Accept"] = "application/json";

  LogDebug(method + " " + path);
  platform::HttpClientResponse response;
  {
    platform::CancellationToken token;
    platform::DeadlineTimer timer(config_.request_timeout, token);
    try {
      response = transport_.Send(request, token);
    } catch (const std::exception& ex) {
      if (timer.Expired()) {
        LogWarn(method + " " + path + " timed out after " +
                DescribeTimeout(config_.request_timeout));
        return Fail(ErrorCode::kTimeout,
                    "Request timed out after " + DescribeTimeout(config_.request_timeout), 0);
      }
      LogWarn(method + " " + path + " failed: " + ex.what());
      return Fail(ErrorCode::kNetworkError,
                  std::string{"Failed to connect to img-src.io API: "} + ex.what(), 0);
    }
  }
  status = response.status;

  nlohmann::json payload;
  try {
    payload = nlohmann::json::parse(response.body);
  } catch (const nlohmann::json::parse_error& ex) {
    LogWarn(method + " " + path + " returned an unparsable body (HTTP " +
            std::to_string(response.status) + ")");
    return Fail(ErrorCode::kJsonParseError,
                std::string{"Failed to parse API response: "} + ex.what(), response.status);
  }

  if (!IsSuccessStatus(response.status)) {
    auto error = DecodeErrorBody(payload, response.status);
    LogWarn(method + " " + path + " failed with HTTP " + std::to_string(response.status) + " (" +
            error.CodeString() + ")");
    return RequestOutcome<nlohmann::json>::Failure(std::move(error));
  }

  LogDebug(method + " " + path + " completed with HTTP " + std::to_string(response.status));
  return RequestOutcome<nlohmann::json>::Success(std::move(payload));
}

}  // namespace core::api
