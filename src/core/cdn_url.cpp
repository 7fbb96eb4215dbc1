#include "core/cdn_url.hpp"

#include <vector>

#include "core/path_sanitizer.hpp"

namespace core {

nlohmann::json BuildCdnUrl(const std::string& cdn_base_url, const CdnUrlRequest& request) {
  const std::string filepath = security::SanitizePath(request.filepath);
  const std::string username = security::SanitizeUsername(request.username);
  if (username.empty()) {
    return {{"error",
             {{"code", "INVALID_USERNAME"}, {"message", "Username is empty after sanitization"}}}};
  }

  // Only the last extension is replaced: archive.tar.gz -> archive.tar.<fmt>.
  // A dot opening the file name (".hidden") or inside a folder name is kept.
  const auto slash = filepath.rfind('/');
  const std::size_t name_start = slash == std::string::npos ? 0 : slash + 1;
  const auto last_dot = filepath.rfind('.');
  const std::string base_path = (last_dot != std::string::npos && last_dot > name_start)
                                    ? filepath.substr(0, last_dot)
                                    : filepath;
  const std::string extension = request.format.value_or("webp");

  std::vector<std::string> params;
  if (request.width && *request.width != 0) {
    params.push_back("w=" + std::to_string(*request.width));
  }
  if (request.height && *request.height != 0) {
    params.push_back("h=" + std::to_string(*request.height));
  }
  if (request.fit && !request.fit->empty()) {
    params.push_back("fit=" + *request.fit);
  }
  if (request.quality && *request.quality != 0) {
    params.push_back("q=" + std::to_string(*request.quality));
  }

  std::string url = cdn_base_url + "/i/" + username + "/" + base_path + "." + extension;
  for (std::size_t i = 0; i < params.size(); ++i) {
    url += (i == 0 ? "?" : "&") + params[i];
  }

  nlohmann::json parameters = {{"username", username},
                               {"filepath", filepath},
                               {"fit", request.fit.value_or("contain")},
                               {"quality", request.quality.value_or(80)},
                               {"format", extension}};
  if (request.width) {
    parameters["width"] = *request.width;
  }
  if (request.height) {
    parameters["height"] = *request.height;
  }
  return {{"success", true}, {"url", url}, {"parameters", parameters}};
}

}  // namespace core
