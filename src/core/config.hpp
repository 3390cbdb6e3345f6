/**
 * @file config.hpp
 * @brief Executor, janitor and logging configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"

namespace async_executor {

struct ExecutorConfig {
    uint32_t max_workers = 4;
    uint32_t default_task_timeout_s = 300;       ///< Advisory only
    uint32_t shutdown_grace_ms = 10000;
    uint32_t trace_throttle_active_threshold = 20;
    uint32_t trace_throttle_every = 5;
};

struct JanitorConfig {
    bool enabled = true;
    uint32_t interval_ms = 30000;
};

struct LoggingConfig {
    std::string level = "info";
    bool log_to_file = false;
    std::filesystem::path log_dir = "./logs";
    bool log_to_console = true;
    uint32_t max_file_size_mb = 10;
    uint32_t rotate_count = 5;
    uint32_t queue_capacity = 0;                 ///< 0 = unbounded
    uint32_t drain_timeout_ms = 5000;
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    ExecutorConfig executor;
    JanitorConfig janitor;
    LoggingConfig logging;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing keys keep their defaults; the result is validated before it is
 * returned.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Reject values the executor cannot run with.
 */
Result<Config> validate_config(Config config);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace async_executor
