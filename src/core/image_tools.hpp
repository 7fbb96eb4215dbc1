#pragma once

#include <optional>
#include <string>

#include "core/cdn_url.hpp"
#include "core/config.hpp"
#include "core/request_client.hpp"
#include "nlohmann/json.hpp"
#include "platform/http_client.hpp"

namespace core::tools {

struct UploadImageArgs {
  std::optional<std::string> url;
  std::optional<std::string> data;
  std::optional<std::string> mime_type;
  std::optional<std::string> filepath;
};

struct ListImagesArgs {
  std::optional<std::string> folder;
  std::optional<int> limit;
  std::optional<int> offset;
};

struct SearchImagesArgs {
  std::string query;
  std::optional<int> limit;
  std::optional<int> offset;
};

// Bytes ready for the multipart upload.
struct ImageBlob {
  std::string bytes;
  std::string mime_type;
  std::string filename;
};

// Handlers behind the MCP tools. Every handler returns a JSON payload; a
// failure is reported as {"error": {"code", "message", ...}} and never thrown.
class ImageTools {
 public:
  ImageTools(const ClientConfig& config, platform::Transport& transport);

  nlohmann::json UploadImage(const UploadImageArgs& args) const;
  nlohmann::json ListImages(const ListImagesArgs& args) const;
  nlohmann::json SearchImages(const SearchImagesArgs& args) const;
  nlohmann::json GetImage(const std::string& id) const;
  nlohmann::json DeleteImage(const std::string& id) const;
  nlohmann::json GetUsage() const;
  nlohmann::json GetSettings() const;
  nlohmann::json GetCdnUrl(const CdnUrlRequest& request) const;

  // MCP resources: imgsrc://images/<id>.
  nlohmann::json ListImageResources() const;
  nlohmann::json ReadImageResource(const std::string& uri) const;

 private:
  // Guarded, deadline-bounded GET of a caller-supplied URL. Returns an error
  // payload on failure and fills `blob` on success.
  std::optional<nlohmann::json> FetchRemoteImage(const std::string& url, ImageBlob& blob) const;

  const ClientConfig& config_;
  platform::Transport& transport_;
  api::RequestClient client_;
};

nlohmann::json MakeToolError(const std::string& code, const std::string& message);

// Standard base64 with or without padding; whitespace is ignored.
std::optional<std::string> DecodeBase64(const std::string& text);

std::string EncodeUriComponent(const std::string& value);

}  // namespace core::tools
