#pragma once

#include <chrono>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "platform/cancellation.hpp"

namespace httplib {
struct Response;
}

namespace platform {

struct MultipartPart {
  std::string name;
  std::string content;
  std::string filename;
  std::string content_type;
};

struct HttpClientRequest {
  std::string method = "GET";
  // Absolute URL, scheme included.
  std::string url;
  std::map<std::string, std::string> headers;
  std::string body;
  // When non-empty the body is replaced by a multipart/form-data encoding of
  // these parts and the transport supplies the Content-Type boundary. Only
  // valid with POST.
  std::vector<MultipartPart> multipart;
  std::chrono::milliseconds timeout{30000};
};

struct HttpClientResponse {
  int status = 0;
  std::string reason;
  std::string content_type;
  std::string body;
  std::map<std::string, std::string> headers;
};

// Raised for any failure below the HTTP layer: connect, TLS, read, abort.
class TransportError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class Transport {
 public:
  virtual ~Transport() = default;

  virtual HttpClientResponse Send(const HttpClientRequest& request,
                                  CancellationToken& token) = 0;
};

class HttpClient : public Transport {
 public:
  HttpClient() = default;

  HttpClientResponse Send(const HttpClientRequest& request, CancellationToken& token) override;

 private:
  HttpClientResponse ConvertResponse(const httplib::Response& response) const;
  [[noreturn]] void Raise(const std::string& target, const std::string& detail) const;
};

struct ParsedUrl {
  std::string scheme;
  std::string host;
  int port = 80;
  std::string target = "/";
};

// Splits an absolute http(s) URL into its connection parts. Throws
// std::invalid_argument when the URL has no scheme or an invalid port.
ParsedUrl ParseUrl(const std::string& url);

}  // namespace platform
