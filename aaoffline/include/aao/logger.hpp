#pragma once

#include <string>

namespace aao {

enum class LogLevel { Debug = 0, Info, Warn, Error };

// Open (truncate) the log file; stdout logging works without it.
void initLogFile(const std::string& path);
void setLogLevel(LogLevel level);
void setLogLevelFromString(const std::string& level);
LogLevel logLevel();

// Tagged logging helpers. logLine remains for quick messages (Info level, "APP" tag).
void logLine(const std::string& msg);
void logDebug(const std::string& msg, const std::string& tag = "DBG");
void logInfo(const std::string& msg, const std::string& tag = "APP");
void logWarn(const std::string& msg, const std::string& tag = "APP");
void logError(const std::string& msg, const std::string& tag = "APP");

} // namespace aao
