#pragma once

#include <string>

namespace helpmirror {

enum class LogLevel { Debug = 0, Info, Warn, Error };

// Starts a fresh log file at path (parent directory created as needed).
// Without a log file, lines still go to stderr.
bool initLogFile(const std::string& path);
void closeLogFile();
void setLogLevel(LogLevel level);
void setLogLevelFromString(const std::string& level);
LogLevel logLevel();

// Tagged logging helpers.
void logDebug(const std::string& msg, const std::string& tag = "DBG");
void logInfo(const std::string& msg, const std::string& tag = "APP");
void logWarn(const std::string& msg, const std::string& tag = "APP");
void logError(const std::string& msg, const std::string& tag = "APP");

} // namespace helpmirror
