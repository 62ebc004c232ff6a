#include "threnody/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <vector>

namespace threnody {

namespace {

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARNING: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    std::string val = name;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (val == "trace") return LogLevel::TRACE;
    if (val == "debug") return LogLevel::DEBUG;
    if (val == "info") return LogLevel::INFO;
    if (val == "warning" || val == "warn") return LogLevel::WARNING;
    if (val == "error") return LogLevel::ERROR;
    if (val == "critical") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

class Logger::Impl {
public:
    std::shared_ptr<spdlog::logger> logger;
    LogLevel level = LogLevel::INFO;
    mutable std::mutex mutex;

    Impl() {
        rebuild(LogLevel::INFO, "");
    }

    // Console goes to stderr: stdout is reserved for the event stream.
    void rebuild(LogLevel new_level, const std::string& file) {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (!file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, false));
        }

        auto created = std::make_shared<spdlog::logger>("threnody", sinks.begin(), sinks.end());
        created->set_level(to_spdlog(new_level));
        created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        created->flush_on(spdlog::level::warn);

        std::lock_guard<std::mutex> lock(mutex);
        logger = std::move(created);
        level = new_level;
    }

    std::shared_ptr<spdlog::logger> current() const {
        std::lock_guard<std::mutex> lock(mutex);
        return logger;
    }
};

std::shared_ptr<Logger> Logger::getInstance() {
    static std::shared_ptr<Logger> instance = std::make_shared<Logger>();
    return instance;
}

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

void Logger::trace(const std::string& message) {
    pImpl->current()->trace(message);
}

void Logger::debug(const std::string& message) {
    pImpl->current()->debug(message);
}

void Logger::info(const std::string& message) {
    pImpl->current()->info(message);
}

void Logger::warning(const std::string& message) {
    pImpl->current()->warn(message);
}

void Logger::error(const std::string& message) {
    pImpl->current()->error(message);
}

void Logger::critical(const std::string& message) {
    pImpl->current()->critical(message);
}

void Logger::set_level(LogLevel level) {
    auto logger = pImpl->current();
    logger->set_level(to_spdlog(level));
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->level = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->level;
}

void Logger::configure(LogLevel level, const std::string& file) {
    pImpl->rebuild(level, file);
}

} // namespace threnody
