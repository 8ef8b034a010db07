#pragma once

#include <string>

#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif
#include <spdlog/spdlog.h>

namespace nodelink::logging {

enum class LogLevel { trace, debug, info, warn, error, off };

// Installs the process-wide logger. A console sink is added when `console` is set,
// a file sink when `log_file` is non-empty. Safe to call more than once; the last
// call wins.
void configure_logging(LogLevel level, bool console, const std::string& log_file = {});

// Adjusts the level of the installed logger without replacing its sinks.
void set_log_level(LogLevel level);

}  // namespace nodelink::logging

#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
