#include "chronicle/config.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include "chronicle/errors.hpp"

namespace chronicle {

namespace {

uint64_t require_unsigned(const nlohmann::json& value, const std::string& key) {
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>();
    }
    if (!value.is_number_integer() || value.get<int64_t>() < 0) {
        throw ValidationError("config key " + key + " must be a non-negative integer");
    }
    return static_cast<uint64_t>(value.get<int64_t>());
}

std::string require_string(const nlohmann::json& value, const std::string& key) {
    if (!value.is_string()) {
        throw ValidationError("config key " + key + " must be a string");
    }
    return value.get<std::string>();
}

uint64_t parse_env_unsigned(const char* name, const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw ValidationError(std::string(name) + " must be a non-negative integer, got '" +
                              text + "'");
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        throw ValidationError(std::string(name) + " is out of range: " + text);
    }
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

} // anonymous namespace

DeadLetterPolicy parse_dead_letter_policy(const std::string& name) {
    if (name == "skip") return DeadLetterPolicy::Skip;
    if (name == "halt") return DeadLetterPolicy::Halt;
    throw ValidationError("Unknown dead letter policy: " + name);
}

const char* dead_letter_policy_name(DeadLetterPolicy policy) {
    switch (policy) {
        case DeadLetterPolicy::Skip: return "skip";
        case DeadLetterPolicy::Halt: return "halt";
    }
    return "skip";
}

RuntimeConfig RuntimeConfig::from_json(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw ValidationError("configuration must be a JSON object");
    }

    RuntimeConfig config;
    for (const auto& [key, value] : document.items()) {
        if (key == "snapshot_interval") {
            config.snapshot_interval = require_unsigned(value, key);
        } else if (key == "read_page_size") {
            config.read_page_size = require_unsigned(value, key);
        } else if (key == "projection_batch_size") {
            config.projection_batch_size = require_unsigned(value, key);
        } else if (key == "projection_poll_ms") {
            config.projection_poll_interval = std::chrono::milliseconds(require_unsigned(value, key));
        } else if (key == "dead_letter_policy") {
            config.dead_letter_policy = parse_dead_letter_policy(require_string(value, key));
        } else if (key == "projection_partitions") {
            config.projection_partitions = require_unsigned(value, key);
        } else if (key == "step_timeout_ms") {
            config.step_timeout = std::chrono::milliseconds(require_unsigned(value, key));
        } else if (key == "snapshot_queue_capacity") {
            config.snapshot_queue_capacity = require_unsigned(value, key);
        } else if (key == "log_level") {
            config.log_level = parse_log_level(require_string(value, key));
        } else {
            throw ValidationError("Unknown config key: " + key);
        }
    }
    config.validate();
    return config;
}

RuntimeConfig RuntimeConfig::from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw StorageError("Cannot open config file: " + path);
    }
    nlohmann::json document;
    try {
        in >> document;
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError("Invalid JSON in " + path + ": " + e.what());
    }
    return from_json(document);
}

RuntimeConfig RuntimeConfig::load(const std::string& path) {
    RuntimeConfig config = path.empty() ? RuntimeConfig{} : from_file(path);
    config.apply_env();
    config.validate();
    return config;
}

RuntimeConfig& RuntimeConfig::apply_env() {
    if (const char* value = env("CHRONICLE_SNAPSHOT_INTERVAL")) {
        snapshot_interval = parse_env_unsigned("CHRONICLE_SNAPSHOT_INTERVAL", value);
    }
    if (const char* value = env("CHRONICLE_READ_PAGE_SIZE")) {
        read_page_size = parse_env_unsigned("CHRONICLE_READ_PAGE_SIZE", value);
    }
    if (const char* value = env("CHRONICLE_PROJECTION_BATCH_SIZE")) {
        projection_batch_size = parse_env_unsigned("CHRONICLE_PROJECTION_BATCH_SIZE", value);
    }
    if (const char* value = env("CHRONICLE_PROJECTION_POLL_MS")) {
        projection_poll_interval = std::chrono::milliseconds(
            parse_env_unsigned("CHRONICLE_PROJECTION_POLL_MS", value));
    }
    if (const char* value = env("CHRONICLE_DEAD_LETTER_POLICY")) {
        dead_letter_policy = parse_dead_letter_policy(value);
    }
    if (const char* value = env("CHRONICLE_PROJECTION_PARTITIONS")) {
        projection_partitions = parse_env_unsigned("CHRONICLE_PROJECTION_PARTITIONS", value);
    }
    if (const char* value = env("CHRONICLE_STEP_TIMEOUT_MS")) {
        step_timeout = std::chrono::milliseconds(
            parse_env_unsigned("CHRONICLE_STEP_TIMEOUT_MS", value));
    }
    if (const char* value = env("CHRONICLE_LOG_LEVEL")) {
        log_level = parse_log_level(value);
    }
    return *this;
}

void RuntimeConfig::validate() const {
    if (read_page_size == 0) {
        throw ValidationError("read_page_size must be positive");
    }
    if (projection_batch_size == 0) {
        throw ValidationError("projection_batch_size must be positive");
    }
    if (projection_partitions == 0) {
        throw ValidationError("projection_partitions must be positive");
    }
    if (step_timeout.count() == 0) {
        throw ValidationError("step_timeout must be positive");
    }
    if (projection_poll_interval.count() == 0) {
        throw ValidationError("projection_poll_interval must be positive");
    }
}

nlohmann::json RuntimeConfig::to_json() const {
    return {
        {"snapshot_interval", snapshot_interval},
        {"read_page_size", read_page_size},
        {"projection_batch_size", projection_batch_size},
        {"projection_poll_ms", projection_poll_interval.count()},
        {"dead_letter_policy", dead_letter_policy_name(dead_letter_policy)},
        {"projection_partitions", projection_partitions},
        {"step_timeout_ms", step_timeout.count()},
        {"snapshot_queue_capacity", snapshot_queue_capacity},
        {"log_level", log_level_name(log_level)}
    };
}

} // namespace chronicle
