#include "utils/logger.h"
#include <fstream>
#include <ctime>
#include <iostream>
#include <mutex>
#include <atomic>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <cctype>

namespace sigelnet {
namespace utils {

static std::atomic<LogLevel> currentLevel{LogLevel::INFO};
static std::ofstream logFile;
static std::string logPath;
static std::mutex logMutex;
static std::atomic<bool> consoleEnabled{true};
static uint64_t maxFileSize = 10 * 1024 * 1024;
static uint32_t maxFiles = 5;

static const char* levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "?????";
    }
}

static void rotateLocked() {
    if (logPath.empty()) return;
    if (logFile.is_open()) logFile.close();

    std::error_code ec;
    std::filesystem::remove(logPath + "." + std::to_string(maxFiles - 1), ec);
    for (int i = static_cast<int>(maxFiles) - 2; i >= 1; i--) {
        std::string oldPath = logPath + "." + std::to_string(i);
        if (std::filesystem::exists(oldPath, ec)) {
            std::filesystem::rename(oldPath, logPath + "." + std::to_string(i + 1), ec);
        }
    }
    if (maxFiles > 1) {
        std::filesystem::rename(logPath, logPath + ".1", ec);
    } else {
        std::filesystem::remove(logPath, ec);
    }

    logFile.open(logPath, std::ios::app);
}

static void writeLog(LogLevel level, const std::string& category, const std::string& msg) {
    if (level < currentLevel.load()) return;

    std::lock_guard<std::mutex> lock(logMutex);

    time_t now = std::time(nullptr);
    std::tm tmNow{};
    localtime_r(&now, &tmNow);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &tmNow);

    std::ostringstream oss;
    oss << timeBuf << " [" << levelToString(level) << "]";
    if (!category.empty()) {
        oss << " [" << category << "]";
    }
    oss << " " << msg << "\n";
    std::string line = oss.str();

    if (consoleEnabled) {
        if (level >= LogLevel::ERROR) {
            std::cerr << line;
        } else {
            std::cout << line;
        }
    }

    if (logFile.is_open()) {
        logFile << line;
        logFile.flush();
        if (logFile.tellp() > static_cast<std::streampos>(maxFileSize)) {
            rotateLocked();
        }
    }
}

void Logger::init(const std::string& path) {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) logFile.close();
    logPath = path;
    if (path.empty()) return;

    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
    }
    logFile.open(path, std::ios::app);
    if (!logFile.is_open()) {
        std::cerr << "Cannot open log file " << path << ", logging to console only\n";
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile.flush();
        logFile.close();
    }
}

void Logger::setLevel(LogLevel level) {
    currentLevel = level;
}

LogLevel Logger::getLevel() {
    return currentLevel;
}

void Logger::enableConsole(bool enable) {
    consoleEnabled = enable;
}

void Logger::setRotation(uint64_t maxBytes, uint32_t files) {
    std::lock_guard<std::mutex> lock(logMutex);
    maxFileSize = std::max<uint64_t>(maxBytes, 4096);
    maxFiles = std::max<uint32_t>(files, 1);
}

void Logger::debug(const std::string& msg) {
    writeLog(LogLevel::DEBUG, "", msg);
}

void Logger::info(const std::string& msg) {
    writeLog(LogLevel::INFO, "", msg);
}

void Logger::warn(const std::string& msg) {
    writeLog(LogLevel::WARN, "", msg);
}

void Logger::error(const std::string& msg) {
    writeLog(LogLevel::ERROR, "", msg);
}

void Logger::fatal(const std::string& msg) {
    writeLog(LogLevel::FATAL, "", msg);
}

void Logger::log(LogLevel level, const std::string& category, const std::string& msg) {
    writeLog(level, category, msg);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) logFile.flush();
    std::cout.flush();
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c) { return std::tolower(c); });
    if (n == "trace") return LogLevel::TRACE;
    if (n == "debug") return LogLevel::DEBUG;
    if (n == "info") return LogLevel::INFO;
    if (n == "warn" || n == "warning") return LogLevel::WARN;
    if (n == "error") return LogLevel::ERROR;
    if (n == "fatal") return LogLevel::FATAL;
    if (n == "off") return LogLevel::OFF;
    return LogLevel::INFO;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "trace";
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
        case LogLevel::FATAL: return "fatal";
        case LogLevel::OFF:   return "off";
    }
    return "info";
}

}
}
