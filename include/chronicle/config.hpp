#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "chronicle/logging.hpp"

namespace chronicle {

/**
 * What a projection does after dead-lettering an event.
 */
enum class DeadLetterPolicy {
    Skip,   // continue past the event
    Halt    // mark the projection Failed and stop its tailing
};

DeadLetterPolicy parse_dead_letter_policy(const std::string& name);
const char* dead_letter_policy_name(DeadLetterPolicy policy);

/**
 * Runtime tunables.
 *
 * Resolution order: defaults, then a JSON file, then CHRONICLE_* environment
 * variables, so the same binary runs in different environments unchanged.
 *
 * Example:
 *   auto config = RuntimeConfig::load("/etc/chronicle.json");
 */
struct RuntimeConfig {
    /// Snapshot every N committed events of a stream; 0 disables snapshots.
    uint64_t snapshot_interval = 100;
    std::size_t read_page_size = 256;
    std::size_t projection_batch_size = 500;
    std::chrono::milliseconds projection_poll_interval{200};
    DeadLetterPolicy dead_letter_policy = DeadLetterPolicy::Skip;
    std::size_t projection_partitions = 1;
    std::chrono::milliseconds step_timeout{30000};
    std::size_t snapshot_queue_capacity = 1024;
    LogLevel log_level = LogLevel::Info;

    /**
     * @throws ValidationError on unknown keys, wrong types or invalid values
     */
    static RuntimeConfig from_json(const nlohmann::json& document);

    /**
     * @throws StorageError if the file cannot be read
     * @throws ValidationError if it is not a valid configuration
     */
    static RuntimeConfig from_file(const std::string& path);

    /**
     * Defaults, overlaid with `path` when non-empty, then the environment.
     */
    static RuntimeConfig load(const std::string& path = "");

    /**
     * Overlay CHRONICLE_* environment variables onto this configuration.
     */
    RuntimeConfig& apply_env();

    /**
     * @throws ValidationError if any value is out of range
     */
    void validate() const;

    nlohmann::json to_json() const;
};

} // namespace chronicle
