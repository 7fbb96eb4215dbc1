#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "core/api_types.hpp"
#include "nlohmann/json.hpp"

namespace core::format {

// "500 bytes", "1.50 KB", "1.00 MB", "2.25 GB".
std::string FormatBytes(std::int64_t bytes);

// Decimal with comma thousands separators: 1234567 -> "1,234,567".
std::string FormatCount(std::int64_t value);

// "12 / 100 uploads (12.0%)" or "12 uploads (unlimited)" without a limit.
std::string FormatUsage(std::int64_t used, std::optional<std::int64_t> limit,
                        const std::string& unit);

// Tool result for get_usage: plan fields, the current period and one
// human-readable line per metered quantity.
nlohmann::json SummarizeUsage(const api::UsageReport& report);

}  // namespace core::format
