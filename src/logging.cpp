#include "chronicle/logging.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include "chronicle/errors.hpp"

namespace chronicle {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_sink_mutex;
LogSink g_sink;

} // anonymous namespace

LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    throw ValidationError("Unknown log level: " + name);
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

void set_log_level(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load());
}

void set_log_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = std::move(sink);
}

std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_utc{};
    gmtime_r(&time_t, &tm_utc);
    std::stringstream ss;
    ss << std::put_time(&tm_utc, "%FT%TZ");
    return ss.str();
}

void log(LogLevel level, const std::string& component, const std::string& message,
         const nlohmann::json& fields) {
    if (static_cast<int>(level) < g_level.load()) return;

    nlohmann::json log_entry = {
        {"level", log_level_name(level)},
        {"message", message},
        {"component", component},
        {"timestamp", now_iso8601()}
    };
    if (fields.is_object()) {
        for (auto& [key, value] : fields.items()) {
            log_entry[key] = value;
        }
    }
    auto line = log_entry.dump();

    std::lock_guard<std::mutex> lock(g_sink_mutex);
    if (g_sink) {
        g_sink(line);
    } else {
        std::cout << line << std::endl;
    }
}

} // namespace chronicle
