#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace core::api {

// Item of GET /api/v1/images.
struct ImageSummary {
  std::string id;
  std::string original_filename;
  std::vector<std::string> paths;
  std::string url;
  std::string visibility;
};

struct ImageListPage {
  std::vector<ImageSummary> images;
  std::int64_t total = 0;
  bool has_more = false;
};

struct PlanLimits {
  std::optional<std::int64_t> max_uploads_per_month;
  std::optional<std::int64_t> max_storage_bytes;
  std::optional<std::int64_t> max_bandwidth_per_month;
  std::optional<std::int64_t> max_api_requests_per_month;
  std::optional<std::int64_t> max_transformations_per_month;
};

struct UsagePeriod {
  std::string period;
  std::int64_t period_start = 0;
  std::int64_t period_end = 0;
  std::int64_t uploads = 0;
  std::int64_t bandwidth_bytes = 0;
  std::int64_t api_requests = 0;
  std::int64_t transformations = 0;
};

// GET /api/v1/usage.
struct UsageReport {
  std::string plan;
  std::string plan_name;
  std::string plan_status;
  PlanLimits plan_limits;
  std::int64_t total_images = 0;
  std::int64_t storage_used_bytes = 0;
  UsagePeriod current_period;
  nlohmann::json credits;
};

// Absent or mistyped fields keep their defaults; only a non-object payload
// is rejected (std::invalid_argument).
void from_json(const nlohmann::json& json, ImageSummary& image);
void from_json(const nlohmann::json& json, ImageListPage& page);
void from_json(const nlohmann::json& json, PlanLimits& limits);
void from_json(const nlohmann::json& json, UsagePeriod& period);
void from_json(const nlohmann::json& json, UsageReport& report);

}  // namespace core::api
