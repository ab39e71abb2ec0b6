#pragma once

// Compile-time floor for library log statements, in spdlog level numbers.
#ifndef JSONMEND_LOG_LEVEL
#define JSONMEND_LOG_LEVEL 1
#endif

#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL JSONMEND_LOG_LEVEL
#endif

#include <memory>
#include <mutex>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace JsonMend {

namespace log {

namespace detail {

struct LoggerSlot {
    std::mutex mutex;
    std::shared_ptr<spdlog::logger> logger;
};

inline LoggerSlot& slot() {
    static LoggerSlot s;
    return s;
}

} // namespace detail

// The library logger, "jsonmend". Writes to stderr at warn level until replaced.
// Not registered with spdlog's global registry.
inline std::shared_ptr<spdlog::logger> logger() {
    detail::LoggerSlot& s = detail::slot();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (!s.logger) {
        s.logger = std::make_shared<spdlog::logger>("jsonmend", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        s.logger->set_level(spdlog::level::warn);
    }
    return s.logger;
}

// Passing nullptr restores the default stderr logger.
inline void set_logger(std::shared_ptr<spdlog::logger> replacement) {
    detail::LoggerSlot& s = detail::slot();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.logger = std::move(replacement);
}

} // namespace log

} // namespace JsonMend

#define JSONMEND_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::JsonMend::log::logger(), __VA_ARGS__)
#define JSONMEND_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::JsonMend::log::logger(), __VA_ARGS__)
#define JSONMEND_LOG_WARN(...) SPDLOG_LOGGER_WARN(::JsonMend::log::logger(), __VA_ARGS__)
