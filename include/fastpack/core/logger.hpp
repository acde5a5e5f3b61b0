#pragma once

#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>

namespace fastpack::core {

enum class LogLevel {
    Trace = spdlog::level::trace,
    Debug = spdlog::level::debug,
    Info = spdlog::level::info,
    Warn = spdlog::level::warn,
    Error = spdlog::level::err,
    Critical = spdlog::level::critical,
    Off = spdlog::level::off
};

class Logger {
public:
    static void initialize(const std::string& log_file, LogLevel level = LogLevel::Info);
    static void shutdown();
    
    // Falls back to spdlog's default logger when initialize() was never called.
    static std::shared_ptr<spdlog::logger> get();
    
    static LogLevel parse_level(const std::string& name, LogLevel fallback = LogLevel::Info);

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace fastpack::core

#define FASTPACK_LOG(level, ...) \
    ::fastpack::core::Logger::get()->log( \
        spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, level, __VA_ARGS__)

#define LOG_TRACE(...) FASTPACK_LOG(spdlog::level::trace, __VA_ARGS__)
#define LOG_DEBUG(...) FASTPACK_LOG(spdlog::level::debug, __VA_ARGS__)
#define LOG_INFO(...) FASTPACK_LOG(spdlog::level::info, __VA_ARGS__)
#define LOG_WARN(...) FASTPACK_LOG(spdlog::level::warn, __VA_ARGS__)
#define LOG_ERROR(...) FASTPACK_LOG(spdlog::level::err, __VA_ARGS__)
#define LOG_CRITICAL(...) FASTPACK_LOG(spdlog::level::critical, __VA_ARGS__)
