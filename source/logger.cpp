#include "helpmirror/logger.hpp"
#include "helpmirror/filesystem.hpp"
#include <fstream>
#include <iostream>
#include <cctype>
#include <mutex>
#include <filesystem>

namespace helpmirror {

static constexpr size_t kMaxLogBytes = 512 * 1024; // then rotate to <path>.1
static bool gLogReady = false;
static LogLevel gMinLevel = LogLevel::Info;
static std::mutex gLogMutex;
static std::ofstream gLogFile;
static std::string gLogPath;
static size_t gLogBytes = 0;

bool initLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(gLogMutex);
    if (gLogFile.is_open()) gLogFile.close();
    gLogReady = false;
    gLogPath = path;
    if (path.empty()) return false;

    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        helpmirror::ensureDirectory(p.parent_path().string());
    }
    // Start a fresh log file on launch
    gLogFile.open(path, std::ios::trunc);
    if (!gLogFile) return false;
    gLogFile << "helpmirror log start\n";
    gLogFile.flush();
    gLogBytes = static_cast<size_t>(gLogFile.tellp());
    gLogReady = true;
    return true;
}

void closeLogFile() {
    std::lock_guard<std::mutex> lock(gLogMutex);
    if (gLogFile.is_open()) gLogFile.close();
    gLogReady = false;
}

void setLogLevel(LogLevel level) { gMinLevel = level; }

LogLevel logLevel() { return gMinLevel; }

void setLogLevelFromString(const std::string& level) {
    std::string l;
    l.reserve(level.size());
    for (char c : level) l.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (l == "debug") gMinLevel = LogLevel::Debug;
    else if (l == "warn") gMinLevel = LogLevel::Warn;
    else if (l == "error") gMinLevel = LogLevel::Error;
    else gMinLevel = LogLevel::Info;
}

static void logInternal(LogLevel level, const std::string& tag, const std::string& msg) {
    if (level < gMinLevel) return;
    std::string line = "[" + tag + "] " + msg;

    std::lock_guard<std::mutex> lock(gLogMutex);
    std::cerr << line << std::endl;
    if (!gLogReady) return;

    auto rotate = []() {
        if (gLogFile.is_open()) gLogFile.close();
        std::error_code ec;
        std::filesystem::path p(gLogPath);
        std::filesystem::path rotated = p;
        rotated += ".1";
        std::filesystem::remove(rotated, ec);
        ec.clear();
        std::filesystem::rename(p, rotated, ec); // best-effort
        gLogFile.open(gLogPath, std::ios::trunc);
        gLogBytes = 0;
        if (gLogFile) {
            gLogFile << "helpmirror log start (rotated)\n";
            gLogFile.flush();
            gLogBytes = static_cast<size_t>(gLogFile.tellp());
        }
    };

    size_t writeBytes = line.size() + 1; // newline
    if (gLogBytes + writeBytes > kMaxLogBytes) {
        rotate();
    }
    if (gLogFile) {
        gLogFile << line << "\n";
        gLogFile.flush();
        gLogBytes += writeBytes;
    }
}

void logDebug(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Debug, tag, msg); }
void logInfo(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Info, tag, msg); }
void logWarn(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Warn, tag, msg); }
void logError(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Error, tag, msg); }

} // namespace helpmirror
