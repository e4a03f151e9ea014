#pragma once

#include <functional>
#include <string>
#include <nlohmann/json.hpp>

namespace chronicle {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/**
 * Receives one serialized JSON log line (without trailing newline).
 */
using LogSink = std::function<void(const std::string&)>;

/**
 * Parse "debug", "info", "warn" or "error".
 * @throws ValidationError on any other value
 */
LogLevel parse_log_level(const std::string& name);

const char* log_level_name(LogLevel level);

void set_log_level(LogLevel level);
LogLevel log_level();

/**
 * Replace the output sink. Passing nullptr restores stdout.
 */
void set_log_sink(LogSink sink);

std::string now_iso8601();

/**
 * Emit one structured log line:
 *   {"level":..., "message":..., "component":..., "timestamp":..., <fields>}
 */
void log(LogLevel level, const std::string& component, const std::string& message,
         const nlohmann::json& fields = {});

inline void log_debug(const std::string& component, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log(LogLevel::Debug, component, message, fields);
}

inline void log_info(const std::string& component, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log(LogLevel::Info, component, message, fields);
}

inline void log_warn(const std::string& component, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log(LogLevel::Warn, component, message, fields);
}

inline void log_error(const std::string& component, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log(LogLevel::Error, component, message, fields);
}

} // namespace chronicle
