#include "core/image_tools.hpp"

#include <openssl/evp.h>

#include <cctype>
#include <cstdio>
#include <exception>
#include <stdexcept>
#include <utility>
#include <vector>

#include "core/api_types.hpp"
#include "core/logging.hpp"
#include "core/path_sanitizer.hpp"
#include "core/url_guard.hpp"
#include "core/usage_format.hpp"
#include "platform/cancellation.hpp"

namespace core::tools {
namespace {

using core::logging::LogDebug;
using core::logging::LogInfo;
using core::logging::LogWarn;
using nlohmann::json;

constexpr char kImagesPath[] = "/api/v1/images";
constexpr char kResourcePrefix[] = "imgsrc://images/";

json ErrorPayload(const api::ApiError& error) { return {{"error", api::ToJson(error)}}; }

// Copies every key of `data` after the leading "success": true, the way the
// list and search tools pass API pages through.
json SuccessWith(const json& data) {
  json result = {{"success", true}};
  if (data.is_object()) {
    for (const auto& [key, value] : data.items()) {
      result[key] = value;
    }
  }
  return result;
}

std::string LastSegment(const std::string& path) {
  const auto slash = path.rfind('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string BuildQuery(const std::vector<std::pair<std::string, std::string>>& params) {
  std::string query;
  for (const auto& [key, value] : params) {
    query += query.empty() ? "?" : "&";
    query += EncodeUriComponent(key) + "=" + EncodeUriComponent(value);
  }
  return query;
}

void AppendPaging(std::vector<std::pair<std::string, std::string>>& params,
                  const std::optional<int>& limit, const std::optional<int>& offset) {
  if (limit && *limit != 0) {
    params.emplace_back("limit", std::to_string(*limit));
  }
  if (offset && *offset != 0) {
    params.emplace_back("offset", std::to_string(*offset));
  }
}

// The transport parses the URL again on its own. A fetch is only allowed when
// it would connect to the very host the guard approved.
bool TransportAgreesOnHost(const std::string& url) {
  const auto target = security::ParseUrlTarget(url);
  if (!target) {
    return false;
  }
  platform::ParsedUrl parsed;
  try {
    parsed = platform::ParseUrl(url);
  } catch (const std::invalid_argument& ex) {
    LogDebug(std::string{"Transport cannot parse image URL: "} + ex.what());
    return false;
  }
  std::string host = parsed.host;
  for (auto& ch : host) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  if (host.size() > 1 && host.back() == '.') {
    host.pop_back();
  }
  return host == target->hostname;
}

std::string FormatMegabytes(std::size_t bytes) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.2f",
                static_cast<double>(bytes) / (1024.0 * 1024.0));
  return buffer;
}

}  // namespace

json MakeToolError(const std::string& code, const std::string& message) {
  return {{"error", {{"code", code}, {"message", message}}}};
}

std::optional<std::string> DecodeBase64(const std::string& text) {
  std::string compact;
  compact.reserve(text.size());
  for (char ch : text) {
    if (!std::isspace(static_cast<unsigned char>(ch))) {
      compact.push_back(ch);
    }
  }
  if (compact.empty()) {
    return std::string{};
  }
  if (compact.size() % 4 == 1) {
    return std::nullopt;
  }
  while (compact.size() % 4 != 0) {
    compact.push_back('=');
  }

  std::string decoded(compact.size() / 4 * 3, '\0');
  const int length =
      EVP_DecodeBlock(reinterpret_cast<unsigned char*>(decoded.data()),
                      reinterpret_cast<const unsigned char*>(compact.data()),
                      static_cast<int>(compact.size()));
  if (length < 0) {
    return std::nullopt;
  }
  // EVP_DecodeBlock counts padding as zero bytes.
  std::size_t padding = 0;
  if (compact.back() == '=') {
    ++padding;
  }
  if (compact[compact.size() - 2] == '=') {
    ++padding;
  }
  decoded.resize(static_cast<std::size_t>(length) - padding);
  return decoded;
}

std::string EncodeUriComponent(const std::string& value) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string encoded;
  for (unsigned char ch : value) {
    if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
        ch == '-' || ch == '_' || ch == '.' || ch == '~') {
      encoded.push_back(static_cast<char>(ch));
    } else {
      encoded.push_back('%');
      encoded.push_back(kHex[(ch >> 4) & 0x0F]);
      encoded.push_back(kHex[ch & 0x0F]);
    }
  }
  return encoded;
}

ImageTools::ImageTools(const ClientConfig& config, platform::Transport& transport)
    : config_(config), transport_(transport), client_(config, transport) {}

std::optional<json> ImageTools::FetchRemoteImage(const std::string& url, ImageBlob& blob) const {
  platform::HttpClientRequest request;
  request.method = "GET";
  request.url = url;
  request.timeout = config_.request_timeout + api::kSocketTimeoutSlack;
  request.headers["Accept"] = "image/*";

  LogDebug("Fetching image from " + url);
  platform::HttpClientResponse response;
  {
    platform::CancellationToken token;
    platform::DeadlineTimer timer(config_.request_timeout, token);
    try {
      response = transport_.Send(request, token);
    } catch (const std::exception& ex) {
      if (timer.Expired()) {
        return MakeToolError("TIMEOUT", "Image fetch timed out after " +
                                            api::DescribeTimeout(config_.request_timeout));
      }
      return MakeToolError("FETCH_ERROR",
                           std::string{"Failed to fetch image from URL: "} + ex.what());
    }
  }

  if (response.status < 200 || response.status >= 300) {
    return MakeToolError("FETCH_FAILED", "Failed to fetch image from URL: " +
                                             std::to_string(response.status) + " " +
                                             response.reason);
  }
  blob.bytes = std::move(response.body);
  blob.mime_type =
      response.content_type.empty() ? "application/octet-stream" : response.content_type;
  return std::nullopt;
}

json ImageTools::UploadImage(const UploadImageArgs& args) const {
  std::optional<std::string> filepath;
  if (args.filepath) {
    auto sanitized = security::SanitizePath(*args.filepath);
    if (!sanitized.empty()) {
      filepath = std::move(sanitized);
    }
  }

  ImageBlob blob;
  if (args.data && !args.data->empty()) {
    auto decoded = DecodeBase64(*args.data);
    if (!decoded) {
      return MakeToolError("INVALID_BASE64", "Failed to decode base64 data");
    }
    blob.bytes = std::move(*decoded);
    blob.mime_type = args.mime_type.value_or("application/octet-stream");
    if (filepath) {
      blob.filename = LastSegment(*filepath);
    } else {
      const auto slash = blob.mime_type.find('/');
      blob.filename = "image." + (slash == std::string::npos || slash + 1 == blob.mime_type.size()
                                      ? std::string{"bin"}
                                      : blob.mime_type.substr(slash + 1));
    }
  } else if (args.url && !args.url->empty()) {
    auto verdict = security::CheckUrl(*args.url);
    if (verdict.allowed && !TransportAgreesOnHost(*args.url)) {
      verdict = security::UrlVerdict{false, std::string{"URL host is ambiguous"}};
    }
    if (!verdict.allowed) {
      const auto reason = verdict.reason.value_or("URL is not allowed");
      LogWarn("Rejected image URL " + *args.url + ": " + reason);
      return ErrorPayload(api::ApiError{api::ErrorCode::kForbiddenUrl, reason, 0, std::nullopt});
    }
    if (auto error = FetchRemoteImage(*args.url, blob)) {
      return *error;
    }
    if (filepath) {
      blob.filename = LastSegment(*filepath);
    } else {
      const auto target = security::ParseUrlTarget(*args.url);
      blob.filename = target ? LastSegment(target->path) : std::string{};
    }
  } else {
    return MakeToolError("MISSING_INPUT", "Either url or data is required");
  }
  if (blob.filename.empty()) {
    blob.filename = "image";
  }

  if (blob.bytes.size() > config_.max_image_bytes) {
    return MakeToolError("IMAGE_TOO_LARGE", "Image size (" + FormatMegabytes(blob.bytes.size()) +
                                                " MB) exceeds " +
                                                std::to_string(config_.max_image_bytes /
                                                               (1024 * 1024)) +
                                                " MB limit");
  }

  std::vector<platform::MultipartPart> parts;
  parts.push_back({"file", std::move(blob.bytes), blob.filename, blob.mime_type});
  if (filepath) {
    parts.push_back({"filepath", *filepath, "", ""});
  }

  const auto outcome = client_.SendMultipart("POST", kImagesPath, std::move(parts));
  if (!outcome) {
    return ErrorPayload(outcome.Error());
  }
  const auto& image = outcome.Value();
  const auto is_new = image.is_object() ? image.find("is_new") : image.end();
  const bool deduplicated = is_new != image.end() && is_new->is_boolean() && !is_new->get<bool>();
  LogInfo("Uploaded " + blob.filename + (deduplicated ? " (deduplicated)" : ""));
  return {{"success", true},
          {"image", image},
          {"message", deduplicated
                          ? "Image uploaded (deduplicated - identical content already existed)"
                          : "Image uploaded successfully"}};
}

json ImageTools::ListImages(const ListImagesArgs& args) const {
  std::vector<std::pair<std::string, std::string>> params;
  if (args.folder && !args.folder->empty()) {
    params.emplace_back("folder", *args.folder);
  }
  AppendPaging(params, args.limit, args.offset);

  const auto outcome = client_.Send("GET", kImagesPath + BuildQuery(params));
  if (!outcome) {
    return ErrorPayload(outcome.Error());
  }
  return SuccessWith(outcome.Value());
}

json ImageTools::SearchImages(const SearchImagesArgs& args) const {
  std::vector<std::pair<std::string, std::string>> params = {{"q", args.query}};
  AppendPaging(params, args.limit, args.offset);

  const auto outcome =
      client_.Send("GET", std::string{kImagesPath} + "/search" + BuildQuery(params));
  if (!outcome) {
    return ErrorPayload(outcome.Error());
  }
  return SuccessWith(outcome.Value());
}

json ImageTools::GetImage(const std::string& id) const {
  const auto outcome =
      client_.Send("GET", std::string{kImagesPath} + "/" + EncodeUriComponent(id));
  if (!outcome) {
    return ErrorPayload(outcome.Error());
  }
  const auto& data = outcome.Value();
  json result = {{"success", true}};
  for (const char* key : {"id", "metadata", "urls", "visibility", "_links"}) {
    if (data.is_object() && data.contains(key)) {
      result[key] = data.at(key);
    }
  }
  return result;
}

json ImageTools::DeleteImage(const std::string& id) const {
  const auto outcome =
      client_.Send("DELETE", std::string{kImagesPath} + "/" + EncodeUriComponent(id));
  if (!outcome) {
    return ErrorPayload(outcome.Error());
  }
  LogInfo("Deleted image " + id);
  auto result = SuccessWith(outcome.Value());
  result["message"] = "Image deleted successfully";
  return result;
}

json ImageTools::GetUsage() const {
  const auto outcome = client_.SendAs<api::UsageReport>("GET", "/api/v1/usage");
  if (!outcome) {
    return ErrorPayload(outcome.Error());
  }
  return format::SummarizeUsage(outcome.Value());
}

json ImageTools::GetSettings() const {
  const auto outcome = client_.Send("GET", "/api/v1/settings");
  if (!outcome) {
    return ErrorPayload(outcome.Error());
  }
  const auto& data = outcome.Value();
  json settings = nullptr;
  if (data.is_object() && data.contains("settings")) {
    settings = data.at("settings");
  }
  return {{"success", true}, {"settings", settings}};
}

json ImageTools::GetCdnUrl(const CdnUrlRequest& request) const {
  return BuildCdnUrl(config_.cdn_base_url, request);
}

json ImageTools::ListImageResources() const {
  const auto outcome =
      client_.SendAs<api::ImageListPage>("GET", std::string{kImagesPath} + "?limit=100");
  json resources = json::array();
  if (!outcome) {
    LogWarn("resources/list unavailable: " + outcome.Error().message);
    return {{"resources", resources}};
  }
  for (const auto& image : outcome.Value().images) {
    std::string paths;
    for (const auto& path : image.paths) {
      paths += (paths.empty() ? "" : ", ") + path;
    }
    resources.push_back({{"uri", kResourcePrefix + image.id},
                         {"name", image.original_filename},
                         {"mimeType", "image/*"},
                         {"description", "Image: " + paths}});
  }
  return {{"resources", resources}};
}

json ImageTools::ReadImageResource(const std::string& uri) const {
  const std::string prefix = kResourcePrefix;
  if (uri.size() <= prefix.size() || uri.compare(0, prefix.size(), prefix) != 0) {
    return {{"contents", json::array()}};
  }
  const std::string id = uri.substr(prefix.size());
  const auto outcome =
      client_.Send("GET", std::string{kImagesPath} + "/" + EncodeUriComponent(id));
  if (!outcome) {
    LogWarn("resources/read failed for " + uri + ": " + outcome.Error().message);
    return {{"contents", json::array()}};
  }
  return {{"contents", json::array({{{"uri", uri},
                                     {"mimeType", "application/json"},
                                     {"text", outcome.Value().dump(2)}}})}};
}

}  // namespace core::tools
