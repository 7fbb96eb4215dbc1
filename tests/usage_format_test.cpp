#include <iostream>
#include <string>

#include "core/api_types.hpp"
#include "core/cdn_url.hpp"
#include "core/usage_format.hpp"
#include "test_support.hpp"

namespace {

using core::BuildCdnUrl;
using core::CdnUrlRequest;
using core::format::FormatBytes;
using core::format::FormatCount;
using core::format::FormatUsage;
using nlohmann::json;
using testing_support::Assert;
using testing_support::AssertEqual;

const std::string kCdn = "https://img-src.io";

void TestFormatBytes() {
  AssertEqual(FormatBytes(0), std::string{"0 bytes"}, "zero");
  AssertEqual(FormatBytes(500), std::string{"500 bytes"}, "bytes");
  AssertEqual(FormatBytes(1023), std::string{"1023 bytes"}, "below one KB");
  AssertEqual(FormatBytes(1024), std::string{"1.00 KB"}, "one KB");
  AssertEqual(FormatBytes(1536), std::string{"1.50 KB"}, "fractional KB");
  AssertEqual(FormatBytes(1024 * 1024), std::string{"1.00 MB"}, "one MB");
  AssertEqual(FormatBytes(5 * 1024 * 1024 + 512 * 1024), std::string{"5.50 MB"}, "MB");
  AssertEqual(FormatBytes(std::int64_t{1024} * 1024 * 1024), std::string{"1.00 GB"}, "one GB");
  AssertEqual(FormatBytes(std::int64_t{1024} * 1024 * 1024 * 10), std::string{"10.00 GB"},
              "GB stays the largest unit");
}

void TestFormatCount() {
  AssertEqual(FormatCount(0), std::string{"0"}, "zero");
  AssertEqual(FormatCount(999), std::string{"999"}, "no separator");
  AssertEqual(FormatCount(1000), std::string{"1,000"}, "thousand");
  AssertEqual(FormatCount(1234567), std::string{"1,234,567"}, "million");
  AssertEqual(FormatCount(-12345), std::string{"-12,345"}, "negative");
}

void TestFormatUsage() {
  AssertEqual(FormatUsage(12, 100, "uploads"), std::string{"12 / 100 uploads (12.0%)"}, "limit");
  AssertEqual(FormatUsage(1500, std::nullopt, "requests"),
              std::string{"1,500 requests (unlimited)"}, "unlimited");
  AssertEqual(FormatUsage(3, 0, "uploads"), std::string{"3 / 0 uploads (100.0%)"},
              "zero limit");
  AssertEqual(FormatUsage(0, 0, "uploads"), std::string{"0 / 0 uploads (0.0%)"},
              "zero limit, nothing used");
}

void TestSummarizeUsage() {
  const auto report = json::parse(R"({
    "plan": "free", "plan_name": "Free", "plan_status": "active",
    "total_images": 7, "storage_used_bytes": 1048576,
    "plan_limits": {"max_uploads_per_month": 100, "max_storage_bytes": 10485760,
                    "max_api_requests_per_month": null},
    "current_period": {"period": "2024-06", "period_start": 1717200000,
                       "period_end": 1719791999, "uploads": 25, "api_requests": 1234},
    "credits": {"remaining": 5}
  })").get<core::api::UsageReport>();

  const auto summary = core::format::SummarizeUsage(report);
  Assert(summary.at("success").get<bool>(), "success flag");
  AssertEqual(summary.at("plan_name").get<std::string>(), std::string{"Free"}, "plan name");
  AssertEqual(summary["usage"]["uploads"].get<std::string>(),
              std::string{"25 / 100 uploads (25.0%)"}, "uploads line");
  AssertEqual(summary["usage"]["storage"].get<std::string>(),
              std::string{"1.00 MB used / 10.00 MB (10.0%)"}, "storage line");
  AssertEqual(summary["usage"]["api_requests"].get<std::string>(),
              std::string{"1,234 requests (unlimited)"}, "requests line");
  AssertEqual(summary["current_period"]["period"].get<std::string>(), std::string{"2024-06"},
              "period");
  AssertEqual(summary["total_images"].get<std::int64_t>(), std::int64_t{7}, "total images");
  AssertEqual(summary["credits"]["remaining"].get<int>(), 5, "credits passed through");
}

void TestCdnUrlWithAllParameters() {
  CdnUrlRequest request;
  request.username = "testuser";
  request.filepath = "photos/beach.jpg";
  request.width = 800;
  request.height = 600;
  request.quality = 85;
  request.fit = "cover";
  request.format = "webp";

  const auto result = BuildCdnUrl(kCdn, request);
  Assert(result.value("success", false), "success flag");
  AssertEqual(result.at("url").get<std::string>(),
              std::string{"https://img-src.io/i/testuser/photos/beach.webp?w=800&h=600&fit=cover&q=85"},
              "url");
  AssertEqual(result["parameters"]["width"].get<int>(), 800, "width echoed");
}

void TestCdnUrlDefaults() {
  CdnUrlRequest request;
  request.username = "testuser";
  request.filepath = "image.png";

  const auto result = BuildCdnUrl(kCdn, request);
  AssertEqual(result.at("url").get<std::string>(),
              std::string{"https://img-src.io/i/testuser/image.webp"}, "no query string");
  AssertEqual(result["parameters"]["fit"].get<std::string>(), std::string{"contain"},
              "default fit");
  AssertEqual(result["parameters"]["quality"].get<int>(), 80, "default quality");
  Assert(!result["parameters"].contains("width"), "width absent");
}

void TestCdnUrlExtensionHandling() {
  CdnUrlRequest request;
  request.username = "testuser";
  request.filepath = "files/archive.tar.gz";
  request.format = "avif";
  AssertEqual(BuildCdnUrl(kCdn, request).at("url").get<std::string>(),
              std::string{"https://img-src.io/i/testuser/files/archive.tar.avif"},
              "only the last extension is replaced");

  request.filepath = "albums.2024/cover";
  AssertEqual(BuildCdnUrl(kCdn, request).at("url").get<std::string>(),
              std::string{"https://img-src.io/i/testuser/albums.2024/cover.avif"},
              "folder dots are not extensions");

  request.filepath = ".hidden";
  AssertEqual(BuildCdnUrl(kCdn, request).at("url").get<std::string>(),
              std::string{"https://img-src.io/i/testuser/.hidden.avif"}, "leading dot kept");
}

void TestCdnUrlSanitizesInputs() {
  CdnUrlRequest request;
  request.username = "test@user/../admin";
  request.filepath = "../../secret/photo.jpg";
  const auto result = BuildCdnUrl(kCdn, request);
  AssertEqual(result.at("url").get<std::string>(),
              std::string{"https://img-src.io/i/testuseradmin/secret/photo.webp"},
              "sanitized url");

  request.username = "@@@";
  const auto rejected = BuildCdnUrl(kCdn, request);
  Assert(rejected.contains("error"), "empty username should fail");
  AssertEqual(rejected["error"]["code"].get<std::string>(), std::string{"INVALID_USERNAME"},
              "error code");
}

void RunTests() {
  TestFormatBytes();
  TestFormatCount();
  TestFormatUsage();
  TestSummarizeUsage();
  TestCdnUrlWithAllParameters();
  TestCdnUrlDefaults();
  TestCdnUrlExtensionHandling();
  TestCdnUrlSanitizesInputs();
}

}  // namespace

int main() {
  try {
    RunTests();
    std::cout << "usage_format_test passed\n";
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "usage_format_test failed: " << ex.what() << "\n";
    return 1;
  }
}
