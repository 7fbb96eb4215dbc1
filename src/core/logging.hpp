#pragma once

#include <string>

namespace core::logging {

enum class LogLevel { kError = 0, kWarn, kInfo, kDebug };

// Reads IMGSRC_MCP_LOG_LEVEL (error, warn, info, debug).
void InitializeFromEnvironment();
void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();
bool IsDebugEnabled();
LogLevel ParseLevel(std::string value);

// All output goes to stderr; stdout is reserved for the MCP channel.
void Log(LogLevel level, const std::string& message);
void LogInfo(const std::string& message);
void LogWarn(const std::string& message);
void LogError(const std::string& message);
void LogDebug(const std::string& message);

}  // namespace core::logging
