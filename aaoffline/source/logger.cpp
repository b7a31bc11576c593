#include "aao/logger.hpp"
#include <fstream>
#include <iostream>
#include <cctype>
#include <mutex>
#include <atomic>
#include <filesystem>

namespace aao {

static constexpr size_t kMaxLogBytes = 512 * 1024;
static bool gLogReady = false;
static std::atomic<LogLevel> gMinLevel{LogLevel::Info};
static std::mutex gLogMutex;
static std::ofstream gLogFile;
static std::string gLogPath;
static size_t gLogBytes = 0;

void initLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(gLogMutex);
    if (gLogFile.is_open()) gLogFile.close();
    gLogReady = false;
    gLogPath = path;
    if (gLogPath.empty()) return;
    std::filesystem::path p(gLogPath);
    std::error_code ec;
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);
    gLogFile.open(gLogPath, std::ios::trunc);
    if (gLogFile) {
        gLogFile << "aaoffline log start\n";
        gLogFile.flush();
        gLogBytes = static_cast<size_t>(gLogFile.tellp());
        gLogReady = true;
    }
}

void setLogLevel(LogLevel level) { gMinLevel.store(level); }

LogLevel logLevel() { return gMinLevel.load(); }

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
    if (level < gMinLevel.load()) return;
    std::string line = "[" + tag + "] " + msg;

    std::lock_guard<std::mutex> lock(gLogMutex);
    // Workers log concurrently; one lock keeps stdout lines whole too.
    if (level >= LogLevel::Warn) std::cerr << line << std::endl;
    else std::cout << line << std::endl;
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
            gLogFile << "aaoffline log start (rotated)\n";
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

void logLine(const std::string& msg) { logInternal(LogLevel::Info, "APP", msg); }
void logDebug(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Debug, tag, msg); }
void logInfo(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Info, tag, msg); }
void logWarn(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Warn, tag, msg); }
void logError(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Error, tag, msg); }

} // namespace aao
