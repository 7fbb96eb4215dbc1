#include "platform/http_client.hpp"

#include <cctype>
#include <stdexcept>
#include <string>

#include "httplib.h"

namespace {

std::string Trim(const std::string& value) {
  std::size_t first = 0;
  std::size_t last = value.size();
  while (first < value.size() && std::isspace(static_cast<unsigned char>(value[first]))) {
    ++first;
  }
  while (last > first && std::isspace(static_cast<unsigned char>(value[last - 1]))) {
    --last;
  }
  return value.substr(first, last - first);
}

}  // namespace

namespace platform {

ParsedUrl ParseUrl(const std::string& url) {
  ParsedUrl parsed;
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0) {
    throw std::invalid_argument("URL must include a scheme (e.g., https://api.img-src.io): " +
                                url);
  }

  parsed.scheme = url.substr(0, scheme_end);
  for (auto& ch : parsed.scheme) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  if (parsed.scheme != "http" && parsed.scheme != "https") {
    throw std::invalid_argument("Unsupported URL scheme: " + parsed.scheme);
  }

  auto authority = url.substr(scheme_end + 3);
  const auto target_pos = authority.find_first_of("/?#");
  if (target_pos != std::string::npos) {
    parsed.target = authority.substr(target_pos);
    authority = authority.substr(0, target_pos);
    const auto fragment = parsed.target.find('#');
    if (fragment != std::string::npos) {
      parsed.target.erase(fragment);
    }
    if (parsed.target.empty() || parsed.target.front() != '/') {
      parsed.target.insert(parsed.target.begin(), '/');
    }
  }
  if (const auto at = authority.rfind('@'); at != std::string::npos) {
    authority = authority.substr(at + 1);
  }

  std::string port_str;
  if (!authority.empty() && authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string::npos) {
      throw std::invalid_argument("Unterminated IPv6 literal in URL: " + url);
    }
    parsed.host = authority.substr(0, close + 1);
    if (close + 1 < authority.size() && authority[close + 1] == ':') {
      port_str = authority.substr(close + 2);
    }
  } else {
    const auto colon_pos = authority.find(':');
    parsed.host = authority.substr(0, colon_pos);
    if (colon_pos != std::string::npos) {
      port_str = authority.substr(colon_pos + 1);
    }
  }
  if (parsed.host.empty()) {
    throw std::invalid_argument("URL has no host: " + url);
  }

  parsed.port = (parsed.scheme == "https") ? 443 : 80;
  if (!port_str.empty()) {
    for (char ch : port_str) {
      if (!std::isdigit(static_cast<unsigned char>(ch))) {
        throw std::invalid_argument("Port extracted from URL is invalid: " + url);
      }
    }
    if (port_str.size() > 5 || std::stoi(port_str) <= 0 || std::stoi(port_str) > 65535) {
      throw std::invalid_argument("Port extracted from URL is invalid: " + url);
    }
    parsed.port = std::stoi(port_str);
  }
  return parsed;
}

HttpClientResponse HttpClient::Send(const HttpClientRequest& request, CancellationToken& token) {
  const auto url = ParseUrl(request.url);
  httplib::Client client(url.scheme + "://" + url.host + ":" + std::to_string(url.port));
  client.set_connection_timeout(request.timeout);
  client.set_read_timeout(request.timeout);
  client.set_write_timeout(request.timeout);
  client.set_follow_location(false);

  if (!request.multipart.empty() && request.method != "POST") {
    Raise(request.method + " " + url.target, "multipart bodies are only sent with POST");
  }

  httplib::Headers headers;
  for (const auto& header : request.headers) {
    headers.emplace(header.first, header.second);
  }

  // Shutting the socket down is what unblocks a read stuck on a silent peer.
  CancelHook hook(token, [&client] { client.stop(); });
  if (token.IsCancelled()) {
    Raise(request.method + " " + url.target, "request aborted");
  }

  httplib::Result result;
  if (request.multipart.empty()) {
    httplib::Request outgoing;
    outgoing.method = request.method;
    outgoing.path = url.target;
    outgoing.headers = headers;
    outgoing.body = request.body;
    result = client.send(outgoing);
  } else {
    // httplib writes the boundary and the Content-Type header itself.
    httplib::MultipartFormDataItems items;
    for (const auto& part : request.multipart) {
      items.push_back({part.name, part.content, part.filename, part.content_type});
    }
    result = client.Post(url.target, headers, items);
  }
  if (!result) {
    Raise(request.method + " " + url.target, httplib::to_string(result.error()));
  }
  return ConvertResponse(*result);
}

HttpClientResponse HttpClient::ConvertResponse(const httplib::Response& result) const {
  HttpClientResponse response;
  response.status = result.status;
  response.reason = result.reason;
  response.content_type = Trim(result.get_header_value("Content-Type"));
  response.body = result.body;
  for (const auto& header : result.headers) {
    response.headers[header.first] = header.second;
  }
  return response;
}

[[noreturn]] void HttpClient::Raise(const std::string& target, const std::string& detail) const {
  throw TransportError("HTTP request failed for " + target + ": " + detail);
}

}  // namespace platform
