#include <chrono>
#include <future>
#include <iostream>
#include <string>

#include "core/api_types.hpp"
#include "core/config.hpp"
#include "core/request_client.hpp"
#include "platform/cancellation.hpp"
#include "test_support.hpp"

namespace {

using namespace std::chrono_literals;
using core::ClientConfig;
using core::api::ErrorCode;
using core::api::RequestClient;
using core::api::UsageReport;
using nlohmann::json;
using platform::DeadlineTimer;
using testing_support::Assert;
using testing_support::AssertEqual;
using testing_support::Contains;
using testing_support::FakeTransport;
using testing_support::MakeResponse;

ClientConfig MakeConfig() {
  ClientConfig config;
  config.api_base_url = "https://api.test";
  config.api_key = "test-key";
  config.request_timeout = 2000ms;
  return config;
}

void TestMissingApiKeyMakesNoCall() {
  ClientConfig config = MakeConfig();
  config.api_key.reset();
  FakeTransport transport;
  transport.Enqueue(MakeResponse(200, "{}"));
  RequestClient client(config, transport);

  const auto outcome = client.Send("GET", "/api/v1/settings");
  Assert(!outcome.Ok(), "missing key should fail");
  Assert(outcome.Error().code == ErrorCode::kMissingApiKey, "code should be MISSING_API_KEY");
  AssertEqual(outcome.Error().status, 401, "status");
  AssertEqual(outcome.Error().CodeString(), std::string{"MISSING_API_KEY"}, "code string");
  Assert(Contains(outcome.Error().message, "IMG_SRC_API_KEY"), "message names the variable");
  AssertEqual(transport.CallCount(), std::size_t{0}, "transport must not be called");
}

void TestUnresponsivePeerTimesOut() {
  ClientConfig config = MakeConfig();
  config.request_timeout = 50ms;
  FakeTransport transport;
  transport.SetHandler(testing_support::NeverRespond);
  RequestClient client(config, transport);

  const auto started = std::chrono::steady_clock::now();
  const auto outcome = client.Send("GET", "/api/v1/images");
  const auto elapsed = std::chrono::steady_clock::now() - started;

  Assert(!outcome.Ok(), "stalled call should fail");
  Assert(outcome.Error().code == ErrorCode::kTimeout, "code should be TIMEOUT");
  AssertEqual(outcome.Error().status, 0, "status");
  AssertEqual(outcome.Error().message, std::string{"Request timed out after 50 ms"}, "message");
  Assert(elapsed < 5s, "call was not aborted at its deadline");
  AssertEqual(DeadlineTimer::PendingCount(), std::size_t{0}, "deadline timer leaked");
}

void TestTimeoutDoesNotAffectSiblingCalls() {
  ClientConfig config = MakeConfig();
  config.request_timeout = 100ms;
  FakeTransport transport;
  transport.SetHandler([](const platform::HttpClientRequest& request,
                          platform::CancellationToken& token) {
    if (Contains(request.url, "/slow")) {
      return testing_support::NeverRespond(request, token);
    }
    Assert(!token.IsCancelled(), "sibling token cancelled");
    return MakeResponse(200, R"({"ok":true})");
  });
  RequestClient client(config, transport);

  auto slow = std::async(std::launch::async, [&client] { return client.Send("GET", "/slow"); });
  auto fast = std::async(std::launch::async, [&client] { return client.Send("GET", "/fast"); });
  const auto fast_outcome = fast.get();
  const auto slow_outcome = slow.get();

  Assert(fast_outcome.Ok(), "fast call should succeed");
  Assert(fast_outcome.Value().at("ok").get<bool>(), "fast payload");
  Assert(!slow_outcome.Ok() && slow_outcome.Error().code == ErrorCode::kTimeout,
         "slow call should time out");
  AssertEqual(DeadlineTimer::PendingCount(), std::size_t{0}, "deadline timer leaked");
}

void TestNonJsonBodyReportsParseError() {
  FakeTransport transport;
  transport.Enqueue(MakeResponse(502, "<html><body>Bad Gateway</body></html>", "text/html"));
  const ClientConfig config = MakeConfig();
  RequestClient client(config, transport);

  const auto outcome = client.Send("GET", "/api/v1/usage");
  Assert(!outcome.Ok(), "HTML body should fail");
  Assert(outcome.Error().code == ErrorCode::kJsonParseError, "code should be JSON_PARSE_ERROR");
  AssertEqual(outcome.Error().status, 502, "status must be the one received");
  Assert(Contains(outcome.Error().message, "Failed to parse API response"), "message");
}

void TestEmptyBodyReportsParseError() {
  FakeTransport transport;
  transport.Enqueue(MakeResponse(200, ""));
  const ClientConfig config = MakeConfig();
  RequestClient client(config, transport);

  const auto outcome = client.Send("DELETE", "/api/v1/images/abc");
  Assert(!outcome.Ok() && outcome.Error().code == ErrorCode::kJsonParseError,
         "empty body should fail to parse");
  AssertEqual(outcome.Error().status, 200, "status");
}

void TestTransportFailureReportsNetworkError() {
  FakeTransport transport;
  transport.SetHandler([](const platform::HttpClientRequest&, platform::CancellationToken&)
                           -> platform::HttpClientResponse {
    throw platform::TransportError("Connection refused");
  });
  const ClientConfig config = MakeConfig();
  RequestClient client(config, transport);

  const auto outcome = client.Send("GET", "/api/v1/settings");
  Assert(!outcome.Ok(), "transport failure should fail");
  Assert(outcome.Error().code == ErrorCode::kNetworkError, "code should be NETWORK_ERROR");
  AssertEqual(outcome.Error().status, 0, "status");
  Assert(Contains(outcome.Error().message, "Connection refused"), "underlying message kept");
  AssertEqual(DeadlineTimer::PendingCount(), std::size_t{0}, "deadline timer leaked");
}

void TestServerErrorCodeIsPassedThrough() {
  FakeTransport transport;
  transport.Enqueue(
      MakeResponse(404, R"({"error":{"code":"NOT_FOUND","message":"Image not found"}})"));
  const ClientConfig config = MakeConfig();
  RequestClient client(config, transport);

  const auto outcome = client.Send("GET", "/api/v1/images/missing");
  Assert(!outcome.Ok(), "404 should fail");
  Assert(outcome.Error().code == ErrorCode::kApiError, "category should be API_ERROR");
  AssertEqual(outcome.Error().CodeString(), std::string{"NOT_FOUND"}, "server code");
  AssertEqual(outcome.Error().message, std::string{"Image not found"}, "server message");
  AssertEqual(outcome.Error().status, 404, "status");

  const auto error_json = core::api::ToJson(outcome.Error());
  AssertEqual(error_json.at("code").get<std::string>(), std::string{"NOT_FOUND"}, "json code");
  AssertEqual(error_json.at("status").get<int>(), 404, "json status");
}

void TestErrorBodyWithoutDetailsUsesDefaults() {
  FakeTransport transport;
  transport.Enqueue(MakeResponse(500, "{}"));
  transport.Enqueue(MakeResponse(403, R"({"error":"forbidden"})"));
  transport.Enqueue(MakeResponse(429, R"({"error":{"message":42}})"));
  const ClientConfig config = MakeConfig();
  RequestClient client(config, transport);

  const auto empty = client.Send("GET", "/api/v1/usage");
  AssertEqual(empty.Error().CodeString(), std::string{"API_ERROR"}, "default code");
  AssertEqual(empty.Error().message, std::string{"API request failed with status 500"},
              "default message");

  const auto string_error = client.Send("GET", "/api/v1/usage");
  AssertEqual(string_error.Error().CodeString(), std::string{"API_ERROR"},
              "non-object error keeps default code");
  AssertEqual(string_error.Error().status, 403, "status");

  const auto typed_wrong = client.Send("GET", "/api/v1/usage");
  AssertEqual(typed_wrong.Error().message, std::string{"API request failed with status 429"},
              "non-string message falls back");
}

void TestRequestHeadersAndUrl() {
  FakeTransport transport;
  transport.Enqueue(MakeResponse(200, R"({"settings":{"default_visibility":"public"}})"));
  const ClientConfig config = MakeConfig();
  RequestClient client(config, transport);

  const auto outcome = client.Send("POST", "/api/v1/things", json{{"name", "x"}});
  Assert(outcome.Ok(), "call should succeed");
  AssertEqual(outcome.Value()["settings"]["default_visibility"].get<std::string>(),
              std::string{"public"}, "payload");

  const auto request = transport.LastRequest();
  AssertEqual(request.method, std::string{"POST"}, "method");
  AssertEqual(request.url, std::string{"https://api.test/api/v1/things"}, "url");
  AssertEqual(request.headers.at("Authorization"), std::string{"Bearer test-key"}, "bearer");
  AssertEqual(request.headers.at("Content-Type"), std::string{"application/json"},
              "json content type");
  AssertEqual(json::parse(request.body).at("name").get<std::string>(), std::string{"x"},
              "body");
  Assert(request.timeout >= config.request_timeout, "socket timeout below the deadline");
}

void TestMultipartLeavesContentTypeToTransport() {
  FakeTransport transport;
  transport.Enqueue(MakeResponse(201, R"({"id":"img_1"})"));
  const ClientConfig config = MakeConfig();
  RequestClient client(config, transport);

  const auto outcome = client.SendMultipart(
      "POST", "/api/v1/images", {{"file", "bytes", "cat.png", "image/png"}});
  Assert(outcome.Ok(), "multipart call should succeed");

  const auto request = transport.LastRequest();
  Assert(request.headers.count("Content-Type") == 0, "multipart must not carry a JSON type");
  AssertEqual(request.headers.at("Authorization"), std::string{"Bearer test-key"}, "bearer");
  AssertEqual(request.multipart.size(), std::size_t{1}, "parts");
  AssertEqual(request.multipart[0].filename, std::string{"cat.png"}, "filename");
}

void TestSendAsDecodesTypedPayload() {
  FakeTransport transport;
  transport.Enqueue(MakeResponse(200, R"({
    "plan": "pro", "plan_name": "Pro", "plan_status": "active",
    "total_images": 42, "storage_used_bytes": 1048576,
    "plan_limits": {"max_uploads_per_month": 1000, "max_storage_bytes": null},
    "current_period": {"period": "2024-06", "uploads": 12, "bandwidth_bytes": 2048}
  })"));
  transport.Enqueue(MakeResponse(200, "[1, 2, 3]"));
  const ClientConfig config = MakeConfig();
  RequestClient client(config, transport);

  const auto report = client.SendAs<UsageReport>("GET", "/api/v1/usage");
  Assert(report.Ok(), "usage should decode");
  AssertEqual(report.Value().plan_name, std::string{"Pro"}, "plan name");
  AssertEqual(report.Value().total_images, std::int64_t{42}, "total images");
  Assert(report.Value().plan_limits.max_uploads_per_month == 1000, "upload limit");
  Assert(!report.Value().plan_limits.max_storage_bytes.has_value(), "null limit is unlimited");
  AssertEqual(report.Value().current_period.uploads, std::int64_t{12}, "period uploads");

  const auto mismatched = client.SendAs<UsageReport>("GET", "/api/v1/usage");
  Assert(!mismatched.Ok(), "array payload cannot be a usage report");
  Assert(mismatched.Error().code == ErrorCode::kJsonParseError, "code should be JSON_PARSE_ERROR");
  AssertEqual(mismatched.Error().status, 200, "status");
}

void TestDescribeTimeout() {
  AssertEqual(core::api::DescribeTimeout(30000ms), std::string{"30 seconds"}, "whole seconds");
  AssertEqual(core::api::DescribeTimeout(250ms), std::string{"250 ms"}, "milliseconds");
}

void RunTests() {
  TestMissingApiKeyMakesNoCall();
  TestUnresponsivePeerTimesOut();
  TestTimeoutDoesNotAffectSiblingCalls();
  TestNonJsonBodyReportsParseError();
  TestEmptyBodyReportsParseError();
  TestTransportFailureReportsNetworkError();
  TestServerErrorCodeIsPassedThrough();
  TestErrorBodyWithoutDetailsUsesDefaults();
  TestRequestHeadersAndUrl();
  TestMultipartLeavesContentTypeToTransport();
  TestSendAsDecodesTypedPayload();
  TestDescribeTimeout();
  AssertEqual(DeadlineTimer::PendingCount(), std::size_t{0}, "deadline timers leaked");
}

}  // namespace

int main() {
  try {
    RunTests();
    std::cout << "request_client_test passed\n";
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "request_client_test failed: " << ex.what() << "\n";
    return 1;
  }
}
