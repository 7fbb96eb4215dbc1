#pragma once

#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <vector>

#include "core/api_error.hpp"
#include "core/config.hpp"
#include "core/request_outcome.hpp"
#include "nlohmann/json.hpp"
#include "platform/http_client.hpp"

namespace core::api {

// Performs single calls against the configured API. Each call owns its own
// deadline timer and cancellation token, so one instance may be shared by
// concurrent callers. No exception escapes Send*().
class RequestClient {
 public:
  RequestClient(const ClientConfig& config, platform::Transport& transport);

  RequestOutcome<nlohmann::json> Send(const std::string& method, const std::string& path,
                                      const std::optional<nlohmann::json>& body = std::nullopt) const;

  RequestOutcome<nlohmann::json> SendMultipart(const std::string& method, const std::string& path,
                                               std::vector<platform::MultipartPart> parts) const;

  // Send() followed by a conversion of the payload into T through
  // nlohmann::json's from_json. A payload T cannot represent is reported as
  // JSON_PARSE_ERROR.
  template <typename T>
  RequestOutcome<T> SendAs(const std::string& method, const std::string& path) const;

  const ClientConfig& Config() const { return config_; }

 private:
  RequestOutcome<nlohmann::json> Execute(const std::string& method, const std::string& path,
                                         platform::HttpClientRequest request, int& status) const;

  const ClientConfig& config_;
  platform::Transport& transport_;
};

// Added to the socket timeouts handed to the transport so that the deadline
// timer, not a socket error, ends an overdue call.
constexpr std::chrono::milliseconds kSocketTimeoutSlack{1000};

// "30 seconds" for whole seconds, "250 ms" otherwise.
std::string DescribeTimeout(std::chrono::milliseconds timeout);

template <typename T>
RequestOutcome<T> RequestClient::SendAs(const std::string& method, const std::string& path) const {
  int status = 0;
  auto outcome = Execute(method, path, platform::HttpClientRequest{}, status);
  if (!outcome.Ok()) {
    return RequestOutcome<T>::Failure(outcome.Error());
  }
  try {
    return RequestOutcome<T>::Success(outcome.Value().template get<T>());
  } catch (const std::exception& ex) {
    return RequestOutcome<T>::Failure(ApiError{ErrorCode::kJsonParseError,
                                               std::string{"Failed to parse API response: "} +
                                                   ex.what(),
                                               status,
                                               std::nullopt});
  }
}

}  // namespace core::api
