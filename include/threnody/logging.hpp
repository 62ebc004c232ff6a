#pragma once

#include <memory>
#include <string>

namespace threnody {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5
};

// Parses "trace", "debug", "info", "warning"/"warn", "error", "critical"
// (case-insensitive). Unknown names map to INFO.
LogLevel parse_log_level(const std::string& name);

class Logger {
public:
    static std::shared_ptr<Logger> getInstance();

    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void critical(const std::string& message);

    void set_level(LogLevel level);
    LogLevel level() const;

    // Rebuilds the sinks: console always, plus a file sink when file is non-empty.
    void configure(LogLevel level, const std::string& file);

    Logger();
    ~Logger();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

#define LOG_TRACE(msg) threnody::Logger::getInstance()->trace(msg)
#define LOG_DEBUG(msg) threnody::Logger::getInstance()->debug(msg)
#define LOG_INFO(msg) threnody::Logger::getInstance()->info(msg)
#define LOG_WARNING(msg) threnody::Logger::getInstance()->warning(msg)
#define LOG_ERROR(msg) threnody::Logger::getInstance()->error(msg)
#define LOG_CRITICAL(msg) threnody::Logger::getInstance()->critical(msg)

} // namespace threnody
