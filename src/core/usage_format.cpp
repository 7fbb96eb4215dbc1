#include "core/usage_format.hpp"

#include <cstdio>

namespace core::format {
namespace {

std::string Fixed(double value, int digits) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.*f", digits, value);
  return buffer;
}

std::string Percentage(std::int64_t used, std::int64_t limit) {
  if (limit <= 0) {
    return used > 0 ? "100.0" : "0.0";
  }
  return Fixed(static_cast<double>(used) / static_cast<double>(limit) * 100.0, 1);
}

}  // namespace

std::string FormatBytes(std::int64_t bytes) {
  constexpr double kKiB = 1024.0;
  constexpr double kMiB = kKiB * 1024.0;
  constexpr double kGiB = kMiB * 1024.0;
  const auto value = static_cast<double>(bytes);
  if (value >= kGiB) {
    return Fixed(value / kGiB, 2) + " GB";
  }
  if (value >= kMiB) {
    return Fixed(value / kMiB, 2) + " MB";
  }
  if (value >= kKiB) {
    return Fixed(value / kKiB, 2) + " KB";
  }
  return std::to_string(bytes) + " bytes";
}

std::string FormatCount(std::int64_t value) {
  const bool negative = value < 0;
  std::string digits = std::to_string(negative ? -value : value);
  std::string grouped;
  for (std::size_t i = 0; i < digits.size(); ++i) {
    if (i != 0 && (digits.size() - i) % 3 == 0) {
      grouped.push_back(',');
    }
    grouped.push_back(digits[i]);
  }
  return negative ? "-" + grouped : grouped;
}

std::string FormatUsage(std::int64_t used, std::optional<std::int64_t> limit,
                        const std::string& unit) {
  if (!limit) {
    return FormatCount(used) + " " + unit + " (unlimited)";
  }
  return FormatCount(used) + " / " + FormatCount(*limit) + " " + unit + " (" +
         Percentage(used, *limit) + "%)";
}

nlohmann::json SummarizeUsage(const api::UsageReport& report) {
  const auto& limits = report.plan_limits;
  const auto& period = report.current_period;

  std::string storage = FormatBytes(report.storage_used_bytes) + " used";
  if (limits.max_storage_bytes && *limits.max_storage_bytes != 0) {
    storage += " / " + FormatBytes(*limits.max_storage_bytes) + " (" +
               Percentage(report.storage_used_bytes, *limits.max_storage_bytes) + "%)";
  } else {
    storage += " (unlimited)";
  }

  return {
      {"success", true},
      {"plan", report.plan},
      {"plan_name", report.plan_name},
      {"plan_status", report.plan_status},
      {"current_period",
       {{"period", period.period}, {"start", period.period_start}, {"end", period.period_end}}},
      {"usage",
       {{"uploads", FormatUsage(period.uploads, limits.max_uploads_per_month, "uploads")},
        {"storage", storage},
        {"bandwidth", FormatUsage(period.bandwidth_bytes, limits.max_bandwidth_per_month,
                                  "bytes (" + FormatBytes(period.bandwidth_bytes) + ")")},
        {"api_requests",
         FormatUsage(period.api_requests, limits.max_api_requests_per_month, "requests")},
        {"transformations", FormatUsage(period.transformations,
                                        limits.max_transformations_per_month,
                                        "transformations")}}},
      {"total_images", report.total_images},
      {"credits", report.credits},
  };
}

}  // namespace core::format
