#include "core/mcp_bridge.hpp"

#include <cmath>
#include <exception>

#include "core/logging.hpp"
#include "core/url_guard.hpp"

namespace core::mcp {
namespace {

using core::logging::LogDebug;
using core::logging::LogError;
using nlohmann::json;

constexpr char kServerName[] = "img-src-mcp";
constexpr char kServerVersion[] = "1.0.0";
constexpr char kDefaultProtocolVersion[] = "2024-11-05";

json StringProperty(const std::string& description) {
  return {{"type", "string"}, {"description", description}};
}

json NumberProperty(const std::string& description) {
  return {{"type", "number"}, {"description", description}};
}

const std::vector<ToolDefinition>& ToolCatalog() {
  static const std::vector<ToolDefinition> kTools = {
      {"upload_image",
       "Upload an image to img-src.io from a URL or base64 data. Supports JPEG, PNG, WebP, GIF, "
       "AVIF, HEIC, and more. Identical content is deduplicated by hash. Returns the image "
       "metadata including CDN URLs for the available formats.",
       {{"type", "object"},
        {"properties",
         {{"url", StringProperty("URL of the image to upload. The server fetches it; private, "
                                 "loopback and metadata addresses are refused.")},
          {"data", StringProperty("Base64-encoded image data. Use this for local file uploads.")},
          {"mimeType", StringProperty("MIME type of the image (e.g., 'image/png'). Required "
                                      "with the data parameter.")},
          {"filepath", StringProperty("Optional storage path (e.g., 'photos/vacation/beach.jpg'). "
                                      "Defaults to the file name from the URL.")}}},
        {"additionalProperties", false}}},
      {"list_images",
       "List images in your img-src.io account with pagination and folder browsing. Returns the "
       "images and subfolders of the given path.",
       {{"type", "object"},
        {"properties",
         {{"folder", StringProperty("Folder path to list (e.g., 'photos/vacation'). Empty lists "
                                    "the root folder.")},
          {"limit", NumberProperty("Maximum number of items to return (default: 50, max: 100).")},
          {"offset", NumberProperty("Number of items to skip for pagination (default: 0).")}}},
        {"additionalProperties", false}}},
      {"search_images",
       "Search images by filename or path. Returns matching images with metadata and CDN URLs.",
       {{"type", "object"},
        {"properties",
         {{"query", StringProperty("Search query matched against filenames and paths.")},
          {"limit", NumberProperty("Maximum number of results to return (default: 20, max: 100).")},
          {"offset", NumberProperty("Number of results to skip for pagination (default: 0).")}}},
        {"required", json::array({"query"})},
        {"additionalProperties", false}}},
      {"get_image",
       "Get detailed metadata for one image by ID: dimensions, format, every associated path and "
       "the CDN URLs.",
       {{"type", "object"},
        {"properties", {{"id", StringProperty("The image ID (UUID format).")}}},
        {"required", json::array({"id"})},
        {"additionalProperties", false}}},
      {"delete_image",
       "Delete an image by ID. Removes the image and all of its paths; its CDN URLs stop "
       "resolving.",
       {{"type", "object"},
        {"properties", {{"id", StringProperty("The image ID (UUID format) to delete.")}}},
        {"required", json::array({"id"})},
        {"additionalProperties", false}}},
      {"get_usage",
       "Get current usage statistics: uploads, storage, bandwidth and API requests against the "
       "plan limits.",
       {{"type", "object"}, {"properties", json::object()}, {"additionalProperties", false}}},
      {"get_settings",
       "Get account settings: username, plan, default image settings and account statistics.",
       {{"type", "object"}, {"properties", json::object()}, {"additionalProperties", false}}},
      {"get_cdn_url",
       "Generate a CDN URL for an image with optional resizing, format conversion and quality "
       "adjustment.",
       {{"type", "object"},
        {"properties",
         {{"username", StringProperty("The username who owns the image.")},
          {"filepath", StringProperty("The image filepath (e.g., 'photos/beach.jpg').")},
          {"width", NumberProperty("Resize width in pixels.")},
          {"height", NumberProperty("Resize height in pixels.")},
          {"fit",
           {{"type", "string"},
            {"enum", {"cover", "contain", "fill", "scale-down"}},
            {"description", "How to fit the image within the dimensions (default: contain)."}}},
          {"quality", NumberProperty("Image quality 1-100 (default: 80).")},
          {"format",
           {{"type", "string"},
            {"enum", {"webp", "avif", "jpeg", "png"}},
            {"description", "Output format. WebP gives the best compression."}}}}},
        {"required", json::array({"username", "filepath"})},
        {"additionalProperties", false}}},
  };
  return kTools;
}

json MakeToolSchemaJson(const ToolDefinition& tool) {
  return {{"name", tool.name}, {"description", tool.description}, {"inputSchema", tool.input_schema}};
}

const json& PromptCatalog() {
  static const json kPrompts = json::array({
      {{"name", "upload-and-share"},
       {"description", "Upload an image and get shareable CDN URLs"},
       {"arguments",
        json::array({{{"name", "imageUrl"}, {"description", "URL of image to upload"},
                      {"required", true}},
                     {{"name", "width"}, {"description", "Resize width (optional)"},
                      {"required", false}}})}},
      {{"name", "check-usage"}, {"description", "Check account usage and storage status"}},
      {{"name", "find-images"},
       {"description", "Search for images by keyword"},
       {"arguments", json::array({{{"name", "query"}, {"description", "Search keyword"},
                                   {"required", true}}})}},
  });
  return kPrompts;
}

// Typed access to a tools/call "arguments" object.
class ArgumentReader {
 public:
  explicit ArgumentReader(const json& arguments) : arguments_(arguments) {
    if (!arguments_.is_null() && !arguments_.is_object()) {
      throw InvalidArguments("Tool arguments must be an object");
    }
  }

  std::optional<std::string> OptionalString(const char* key) const {
    const json* value = Find(key);
    if (value == nullptr) {
      return std::nullopt;
    }
    if (!value->is_string()) {
      throw InvalidArguments(std::string{"Expected string for '"} + key + "'");
    }
    return value->get<std::string>();
  }

  std::string RequireString(const char* key, const char* empty_message) const {
    auto value = OptionalString(key);
    if (!value) {
      throw InvalidArguments(std::string{"Missing or invalid argument: "} + key);
    }
    if (value->empty()) {
      throw InvalidArguments(empty_message);
    }
    return *value;
  }

  std::optional<int> OptionalInt(const char* key, int min, int max) const {
    const json* value = Find(key);
    if (value == nullptr) {
      return std::nullopt;
    }
    if (!value->is_number()) {
      throw InvalidArguments(std::string{"Expected number for '"} + key + "'");
    }
    const double number = value->get<double>();
    if (std::floor(number) != number) {
      throw InvalidArguments(std::string{"Expected integer for '"} + key + "'");
    }
    if (number < min || number > max) {
      throw InvalidArguments(std::string{"'"} + key + "' must be between " +
                             std::to_string(min) + " and " + std::to_string(max));
    }
    return static_cast<int>(number);
  }

  std::optional<std::string> OptionalEnum(const char* key,
                                          const std::vector<std::string>& allowed) const {
    auto value = OptionalString(key);
    if (!value) {
      return std::nullopt;
    }
    for (const auto& option : allowed) {
      if (*value == option) {
        return value;
      }
    }
    std::string options;
    for (const auto& option : allowed) {
      options += (options.empty() ? "" : ", ") + option;
    }
    throw InvalidArguments(std::string{"'"} + key + "' must be one of: " + options);
  }

 private:
  // Absent keys and explicit nulls are treated alike.
  const json* Find(const char* key) const {
    if (!arguments_.is_object()) {
      return nullptr;
    }
    const auto it = arguments_.find(key);
    if (it == arguments_.end() || it->is_null()) {
      return nullptr;
    }
    return &*it;
  }

  const json& arguments_;
};

constexpr int kMaxDimension = 1 << 30;

tools::UploadImageArgs ReadUploadArgs(const ArgumentReader& reader) {
  tools::UploadImageArgs args;
  args.url = reader.OptionalString("url");
  args.data = reader.OptionalString("data");
  args.mime_type = reader.OptionalString("mimeType");
  args.filepath = reader.OptionalString("filepath");
  if (args.url && !security::ParseUrlTarget(*args.url)) {
    throw InvalidArguments("Invalid URL format");
  }
  if (!args.url && !args.data) {
    throw InvalidArguments("Either url or data is required");
  }
  if (args.data && !args.data->empty() && (!args.mime_type || args.mime_type->empty())) {
    throw InvalidArguments("mimeType is required when using data");
  }
  return args;
}

CdnUrlRequest ReadCdnArgs(const ArgumentReader& reader) {
  CdnUrlRequest request;
  request.username = reader.RequireString("username", "Username is required");
  request.filepath = reader.RequireString("filepath", "Filepath is required");
  request.width = reader.OptionalInt("width", 1, kMaxDimension);
  request.height = reader.OptionalInt("height", 1, kMaxDimension);
  request.fit = reader.OptionalEnum("fit", {"cover", "contain", "fill", "scale-down"});
  request.quality = reader.OptionalInt("quality", 1, 100);
  request.format = reader.OptionalEnum("format", {"webp", "avif", "jpeg", "png"});
  return request;
}

std::string PromptArgument(const json& arguments, const char* key) {
  if (!arguments.is_object()) {
    return {};
  }
  const auto it = arguments.find(key);
  if (it == arguments.end() || it->is_null()) {
    return {};
  }
  return it->is_string() ? it->get<std::string>() : it->dump();
}

json UserMessage(const std::string& text) {
  return {{"messages",
           json::array({{{"role", "user"}, {"content", {{"type", "text"}, {"text", text}}}}})}};
}

json MakeResultPayload(const json& id, const json& result) {
  return {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

json MakeErrorPayload(const json& id, int code, const std::string& message) {
  return {{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

}  // namespace

Bridge::Bridge(const ClientConfig& config, platform::Transport& transport)
    : tools_(config, transport) {}

json Bridge::ToolSchemasJson() const {
  json tools = json::array();
  for (const auto& tool : ToolCatalog()) {
    tools.push_back(MakeToolSchemaJson(tool));
  }
  return tools;
}

const std::vector<ToolDefinition>& Bridge::Definitions() const { return ToolCatalog(); }

ToolResult Bridge::CallTool(const std::string& name, const json& arguments) const {
  LogDebug("tools/call " + name);
  json payload;
  try {
    const ArgumentReader reader(arguments);
    if (name == "upload_image") {
      payload = tools_.UploadImage(ReadUploadArgs(reader));
    } else if (name == "list_images") {
      tools::ListImagesArgs args;
      args.folder = reader.OptionalString("folder");
      args.limit = reader.OptionalInt("limit", 1, 100);
      args.offset = reader.OptionalInt("offset", 0, kMaxDimension);
      payload = tools_.ListImages(args);
    } else if (name == "search_images") {
      tools::SearchImagesArgs args;
      args.query = reader.RequireString("query", "Search query is required");
      args.limit = reader.OptionalInt("limit", 1, 100);
      args.offset = reader.OptionalInt("offset", 0, kMaxDimension);
      payload = tools_.SearchImages(args);
    } else if (name == "get_image") {
      payload = tools_.GetImage(reader.RequireString("id", "Image ID is required"));
    } else if (name == "delete_image") {
      payload = tools_.DeleteImage(reader.RequireString("id", "Image ID is required"));
    } else if (name == "get_usage") {
      payload = tools_.GetUsage();
    } else if (name == "get_settings") {
      payload = tools_.GetSettings();
    } else if (name == "get_cdn_url") {
      payload = tools_.GetCdnUrl(ReadCdnArgs(reader));
    } else {
      return {tools::MakeToolError("UNKNOWN_TOOL", "Unknown tool: " + name), true};
    }
  } catch (const InvalidArguments& ex) {
    return {tools::MakeToolError("INVALID_ARGS", ex.what()), true};
  } catch (const std::exception& ex) {
    LogError("Tool " + name + " failed: " + ex.what());
    return {tools::MakeToolError("INTERNAL_ERROR", ex.what()), true};
  }

  const bool is_error = payload.is_object() && payload.contains("error");
  return {std::move(payload), is_error};
}

json Bridge::ListResources() const { return tools_.ListImageResources(); }

json Bridge::ReadResource(const std::string& uri) const { return tools_.ReadImageResource(uri); }

json Bridge::PromptsJson() const { return {{"prompts", PromptCatalog()}}; }

json Bridge::GetPrompt(const std::string& name, const json& arguments) const {
  if (name == "upload-and-share") {
    auto image_url = PromptArgument(arguments, "imageUrl");
    const auto width = PromptArgument(arguments, "width");
    if (image_url.empty()) {
      image_url = "[image URL]";
    }
    return UserMessage("Upload this image: " + image_url +
                       (width.empty() ? "" : " and resize to " + width + "px width") +
                       ". Then give me the CDN URL.");
  }
  if (name == "check-usage") {
    return UserMessage(
        "Check my img-src.io usage stats and let me know if I'm close to any limits.");
  }
  if (name == "find-images") {
    auto query = PromptArgument(arguments, "query");
    if (query.empty()) {
      query = "[keyword]";
    }
    return UserMessage("Find all my images matching \"" + query + "\" and show me the results.");
  }
  throw std::invalid_argument("Unknown prompt: " + name);
}

json FormatToolResult(const ToolResult& result) {
  json content = {{"content", json::array({{{"type", "text"}, {"text", result.payload.dump()}}})}};
  if (result.is_error) {
    content["isError"] = true;
  }
  return content;
}

std::optional<json> HandleMessage(const Bridge& bridge, const json& message, SessionState& state) {
  if (!message.is_object()) {
    return MakeErrorPayload(nullptr, -32600, "Invalid Request");
  }
  const auto method_it = message.find("method");
  const std::string method =
      (method_it != message.end() && method_it->is_string()) ? method_it->get<std::string>() : "";
  const auto id_it = message.find("id");
  const bool is_notification = id_it == message.end();
  const json id = is_notification ? json() : *id_it;
  const json params =
      message.contains("params") && message.at("params").is_object() ? message.at("params")
                                                                      : json::object();

  if (method == "exit") {
    state.exit_requested = true;
    return std::nullopt;
  }
  if (is_notification) {
    // notifications/initialized, notifications/cancelled and friends.
    return std::nullopt;
  }

  try {
    if (method == "initialize") {
      state.initialized = true;
      const auto version = params.find("protocolVersion");
      return MakeResultPayload(
          id, {{"protocolVersion", version != params.end() && version->is_string()
                                       ? version->get<std::string>()
                                       : std::string{kDefaultProtocolVersion}},
               {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}},
               {"capabilities",
                {{"tools", {{"listChanged", false}}},
                 {"resources", json::object()},
                 {"prompts", json::object()}}}});
    }
    if (method == "shutdown") {
      state.initialized = false;
      return MakeResultPayload(id, json::object());
    }
    if (method == "ping") {
      return MakeResultPayload(id, json::object());
    }
    if (method == "tools/list") {
      return MakeResultPayload(id, {{"tools", bridge.ToolSchemasJson()}});
    }
    if (method == "tools/call") {
      const auto name = params.find("name");
      if (name == params.end() || !name->is_string()) {
        return MakeErrorPayload(id, -32602, "tools/call requires a tool name");
      }
      const json arguments = params.contains("arguments") ? params.at("arguments") : json::object();
      return MakeResultPayload(id,
                               FormatToolResult(bridge.CallTool(name->get<std::string>(), arguments)));
    }
    if (method == "resources/list") {
      return MakeResultPayload(id, bridge.ListResources());
    }
    if (method == "resources/read") {
      const auto uri = params.find("uri");
      if (uri == params.end() || !uri->is_string()) {
        return MakeErrorPayload(id, -32602, "resources/read requires a uri");
      }
      return MakeResultPayload(id, bridge.ReadResource(uri->get<std::string>()));
    }
    if (method == "prompts/list") {
      return MakeResultPayload(id, bridge.PromptsJson());
    }
    if (method == "prompts/get") {
      const auto name = params.find("name");
      if (name == params.end() || !name->is_string()) {
        return MakeErrorPayload(id, -32602, "prompts/get requires a prompt name");
      }
      const json arguments = params.contains("arguments") ? params.at("arguments") : json::object();
      try {
        return MakeResultPayload(id, bridge.GetPrompt(name->get<std::string>(), arguments));
      } catch (const std::invalid_argument& ex) {
        return MakeErrorPayload(id, -32602, ex.what());
      }
    }
  } catch (const std::exception& ex) {
    LogError("Failed to handle " + method + ": " + ex.what());
    return MakeErrorPayload(id, -32000, ex.what());
  }

  return MakeErrorPayload(id, -32601, "Unsupported method: " + method);
}

}  // namespace core::mcp
