#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/image_tools.hpp"
#include "nlohmann/json.hpp"
#include "platform/http_client.hpp"

namespace core::mcp {

struct ToolDefinition {
  std::string name;
  std::string description;
  nlohmann::json input_schema;
};

struct ToolResult {
  nlohmann::json payload;
  bool is_error = false;
};

// Raised while reading tool arguments; reported to the agent as INVALID_ARGS.
class InvalidArguments : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

class Bridge {
 public:
  Bridge(const ClientConfig& config, platform::Transport& transport);

  nlohmann::json ToolSchemasJson() const;
  const std::vector<ToolDefinition>& Definitions() const;

  // Validates arguments, runs the tool and never throws.
  ToolResult CallTool(const std::string& name, const nlohmann::json& arguments) const;

  nlohmann::json ListResources() const;
  nlohmann::json ReadResource(const std::string& uri) const;

  nlohmann::json PromptsJson() const;
  // Throws std::invalid_argument for an unknown prompt name.
  nlohmann::json GetPrompt(const std::string& name, const nlohmann::json& arguments) const;

 private:
  tools::ImageTools tools_;
};

// MCP tools/call result: one text item holding the payload, plus isError.
nlohmann::json FormatToolResult(const ToolResult& result);

struct SessionState {
  bool initialized = false;
  bool exit_requested = false;
};

// Handles one JSON-RPC message. Returns the response to write, or
// std::nullopt for notifications.
std::optional<nlohmann::json> HandleMessage(const Bridge& bridge, const nlohmann::json& message,
                                            SessionState& state);

}  // namespace core::mcp
