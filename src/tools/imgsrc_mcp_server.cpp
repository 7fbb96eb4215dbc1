#include <algorithm>
#include <cctype>
#include <exception>
#include <iostream>
#include <optional>
#include <string>

#include "core/config.hpp"
#include "core/logging.hpp"
#include "core/mcp_bridge.hpp"
#include "nlohmann/json.hpp"
#include "platform/http_client.hpp"

namespace {

using core::logging::LogDebug;
using core::logging::LogInfo;
using core::logging::LogWarn;

enum class Framing { kLine, kContentLength };

struct IncomingMessage {
  Framing framing = Framing::kLine;
  // Unset when the frame did not contain valid JSON.
  std::optional<nlohmann::json> payload;
};

std::string TrimCopy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](unsigned char ch) {
                return std::isspace(ch) == 0;
              }));
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
    value.pop_back();
  }
  return value;
}

std::optional<nlohmann::json> ParseJson(const std::string& text) {
  auto parsed = nlohmann::json::parse(text, nullptr, false);
  if (parsed.is_discarded()) {
    return std::nullopt;
  }
  return parsed;
}

// Accepts both newline-delimited JSON (the MCP stdio transport) and
// Content-Length framed messages. Returns std::nullopt at end of input.
std::optional<IncomingMessage> ReadMessage() {
  std::string line;
  while (std::getline(std::cin, line)) {
    line = TrimCopy(line);
    if (line.empty()) {
      continue;
    }
    if (line.front() == '{' || line.front() == '[') {
      return IncomingMessage{Framing::kLine, ParseJson(line)};
    }

    std::size_t content_length = 0;
    do {
      line = TrimCopy(line);
      if (line.empty()) {
        break;
      }
      const auto colon = line.find(':');
      if (colon == std::string::npos) {
        continue;
      }
      std::string key = TrimCopy(line.substr(0, colon));
      std::transform(key.begin(), key.end(), key.begin(),
                     [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
      if (key == "content-length") {
        try {
          content_length = static_cast<std::size_t>(std::stoul(TrimCopy(line.substr(colon + 1))));
        } catch (const std::exception& ex) {
          LogWarn(std::string{"Ignoring malformed Content-Length header: "} + ex.what());
          content_length = 0;
        }
      }
    } while (std::getline(std::cin, line));

    if (content_length == 0) {
      return IncomingMessage{Framing::kContentLength, std::nullopt};
    }
    std::string body(content_length, '\0');
    std::cin.read(body.data(), static_cast<std::streamsize>(content_length));
    if (std::cin.gcount() != static_cast<std::streamsize>(content_length)) {
      return std::nullopt;
    }
    return IncomingMessage{Framing::kContentLength, ParseJson(body)};
  }
  return std::nullopt;
}

void WriteMessage(const nlohmann::json& payload, Framing framing) {
  const std::string serialized = payload.dump();
  if (framing == Framing::kContentLength) {
    std::cout << "Content-Length: " << serialized.size() << "\r\n\r\n" << serialized;
  } else {
    std::cout << serialized << '\n';
  }
  std::cout.flush();
}

}  // namespace

int main() {
  core::logging::InitializeFromEnvironment();
  try {
    const core::ClientConfig config = core::LoadClientConfig();
    if (!config.api_key) {
      LogWarn("IMG_SRC_API_KEY is not set; API tools will report MISSING_API_KEY");
    }

    platform::HttpClient transport;
    const core::mcp::Bridge bridge(config, transport);
    core::mcp::SessionState state;

    LogInfo("img-src MCP server started (API " + config.api_base_url + ")");
    while (!state.exit_requested) {
      auto message = ReadMessage();
      if (!message) {
        break;
      }
      if (!message->payload) {
        WriteMessage({{"jsonrpc", "2.0"},
                      {"id", nullptr},
                      {"error", {{"code", -32700}, {"message", "Parse error"}}}},
                     message->framing);
        continue;
      }
      if (core::logging::IsDebugEnabled()) {
        LogDebug("<- " + message->payload->dump());
      }
      if (auto response = core::mcp::HandleMessage(bridge, *message->payload, state)) {
        WriteMessage(*response, message->framing);
      }
    }

    if (state.initialized && !state.exit_requested) {
      LogDebug("MCP host closed the stream without shutdown");
    }
  } catch (const std::exception& ex) {
    std::cerr << "Fatal img-src MCP server error: " << ex.what() << std::endl;
    return 1;
  }

  LogInfo("img-src MCP server stopped");
  return 0;
}
