#pragma once

#include <functional>
#include <string>
#include <nlohmann/json.hpp>

namespace aspect {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

/**
 * Receives every emitted log entry as a JSON object.
 */
using LogSink = std::function<void(const nlohmann::json&)>;

std::string now_iso8601();

const char* log_level_name(LogLevel level);

/**
 * Parse "debug", "info", "warn"/"warning" or "error" (case-insensitive).
 * Unknown names yield the fallback.
 */
LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::Info);

/**
 * Entries below this level are dropped. Defaults to Info.
 */
void set_log_level(LogLevel level);
LogLevel log_level();

/**
 * Replace the process-wide sink. Passing nullptr restores the stdout sink,
 * which writes one JSON document per line.
 */
void set_log_sink(LogSink sink);

void log(LogLevel level, const std::string& domain, const std::string& message,
         const nlohmann::json& fields = {});

inline void log_debug(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log(LogLevel::Debug, domain, message, fields);
}

inline void log_info(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log(LogLevel::Info, domain, message, fields);
}

inline void log_warn(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log(LogLevel::Warn, domain, message, fields);
}

inline void log_error(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log(LogLevel::Error, domain, message, fields);
}

}  // namespace aspect
