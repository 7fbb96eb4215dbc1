#include "core/api_types.hpp"

#include <stdexcept>

namespace core::api {
namespace {

using nlohmann::json;

void RequireObject(const json& value, const char* what) {
  if (!value.is_object()) {
    throw std::invalid_argument(std::string{what} + " must be an object, got " +
                                value.type_name());
  }
}

std::string StringField(const json& object, const char* key) {
  const auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

std::optional<std::int64_t> OptionalInt(const json& object, const char* key) {
  const auto it = object.find(key);
  if (it == object.end() || !it->is_number()) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(it->get<double>());
}

std::int64_t IntField(const json& object, const char* key) {
  return OptionalInt(object, key).value_or(0);
}

const json& ObjectField(const json& object, const char* key) {
  static const json kEmpty = json::object();
  const auto it = object.find(key);
  if (it == object.end() || !it->is_object()) {
    return kEmpty;
  }
  return *it;
}

}  // namespace

void from_json(const json& value, ImageSummary& image) {
  RequireObject(value, "image");
  image.id = StringField(value, "id");
  image.original_filename = StringField(value, "original_filename");
  image.url = StringField(value, "url");
  image.visibility = StringField(value, "visibility");
  image.paths.clear();
  if (const auto it = value.find("paths"); it != value.end() && it->is_array()) {
    for (const auto& path : *it) {
      if (path.is_string()) {
        image.paths.push_back(path.get<std::string>());
      }
    }
  }
}

void from_json(const json& value, ImageListPage& page) {
  RequireObject(value, "image list");
  page.images.clear();
  if (const auto it = value.find("images"); it != value.end() && it->is_array()) {
    for (const auto& item : *it) {
      if (item.is_object()) {
        page.images.push_back(item.get<ImageSummary>());
      }
    }
  }
  page.total = IntField(value, "total");
  const auto has_more = value.find("has_more");
  page.has_more = has_more != value.end() && has_more->is_boolean() && has_more->get<bool>();
}

void from_json(const json& value, PlanLimits& limits) {
  RequireObject(value, "plan_limits");
  limits.max_uploads_per_month = OptionalInt(value, "max_uploads_per_month");
  limits.max_storage_bytes = OptionalInt(value, "max_storage_bytes");
  limits.max_bandwidth_per_month = OptionalInt(value, "max_bandwidth_per_month");
  limits.max_api_requests_per_month = OptionalInt(value, "max_api_requests_per_month");
  limits.max_transformations_per_month = OptionalInt(value, "max_transformations_per_month");
}

void from_json(const json& value, UsagePeriod& period) {
  RequireObject(value, "current_period");
  period.period = StringField(value, "period");
  period.period_start = IntField(value, "period_start");
  period.period_end = IntField(value, "period_end");
  period.uploads = IntField(value, "uploads");
  period.bandwidth_bytes = IntField(value, "bandwidth_bytes");
  period.api_requests = IntField(value, "api_requests");
  period.transformations = IntField(value, "transformations");
}

void from_json(const json& value, UsageReport& report) {
  RequireObject(value, "usage");
  report.plan = StringField(value, "plan");
  report.plan_name = StringField(value, "plan_name");
  report.plan_status = StringField(value, "plan_status");
  report.plan_limits = ObjectField(value, "plan_limits").get<PlanLimits>();
  report.total_images = IntField(value, "total_images");
  report.storage_used_bytes = IntField(value, "storage_used_bytes");
  report.current_period = ObjectField(value, "current_period").get<UsagePeriod>();
  const auto credits = value.find("credits");
  report.credits = credits != value.end() ? *credits : json();
}

}  // namespace core::api
