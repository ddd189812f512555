#pragma once

#include <string>
#include <cstdint>

namespace sigelnet {
namespace utils {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

class Logger {
public:
    // Opens path for appending. An empty path logs to the console only.
    static void init(const std::string& path);
    static void shutdown();
    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static void enableConsole(bool enable);
    // The file is rotated to path.1 .. path.<maxFiles-1> once it passes maxBytes.
    static void setRotation(uint64_t maxBytes, uint32_t maxFiles);

    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    static void fatal(const std::string& msg);

    static void log(LogLevel level, const std::string& category, const std::string& msg);

    static void flush();

    // Accepts trace, debug, info, warn, error, fatal, off. Unknown names map to INFO.
    static LogLevel parseLevel(const std::string& name);
    static const char* levelName(LogLevel level);
};

#define LOG_DEBUG(msg) do { if (sigelnet::utils::Logger::getLevel() <= sigelnet::utils::LogLevel::DEBUG) sigelnet::utils::Logger::debug(msg); } while(0)
#define LOG_INFO(msg) sigelnet::utils::Logger::info(msg)
#define LOG_WARN(msg) sigelnet::utils::Logger::warn(msg)
#define LOG_ERROR(msg) sigelnet::utils::Logger::error(msg)
#define LOG_FATAL(msg) sigelnet::utils::Logger::fatal(msg)

#define LOG_CAT(level, cat, msg) sigelnet::utils::Logger::log(sigelnet::utils::LogLevel::level, cat, msg)

}
}
