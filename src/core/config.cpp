/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace async_executor {

namespace {

/// Read an integer key and check it fits before narrowing to uint32_t.
Result<uint32_t> read_count(toml::node_view<toml::node> section,
                            std::string_view section_name,
                            std::string_view key,
                            int64_t fallback,
                            int64_t min_value = 0) {
    auto raw = section[key].value_or(fallback);
    if (raw < min_value || raw > int64_t{std::numeric_limits<uint32_t>::max()}) {
        return make_error<uint32_t>(
            ErrorCode::ConfigError,
            std::string{section_name} + "." + std::string{key} + " out of range: "
                + std::to_string(raw));
    }
    return static_cast<uint32_t>(raw);
}

Result<Config> read_config(toml::table& tbl) {
    Config config;
    std::optional<Error> failure;

    auto count = [&failure](toml::node_view<toml::node> section, std::string_view section_name,
                            std::string_view key, uint32_t fallback,
                            int64_t min_value = 0) -> uint32_t {
        auto value = read_count(section, section_name, key, fallback, min_value);
        if (!value) {
            if (!failure) failure = value.error();
            return fallback;
        }
        return *value;
    };

    // [executor]
    if (auto executor = tbl["executor"]; executor.is_table()) {
        auto& out = config.executor;
        out.max_workers = count(executor, "executor", "max_workers", out.max_workers, 1);
        out.default_task_timeout_s = count(executor, "executor", "default_task_timeout_s",
                                           out.default_task_timeout_s);
        out.shutdown_grace_ms = count(executor, "executor", "shutdown_grace_ms",
                                      out.shutdown_grace_ms);
        out.trace_throttle_active_threshold = count(
            executor, "executor", "trace_throttle_active_threshold",
            out.trace_throttle_active_threshold);
        out.trace_throttle_every = count(executor, "executor", "trace_throttle_every",
                                         out.trace_throttle_every, 1);
    }

    // [janitor]
    if (auto janitor = tbl["janitor"]; janitor.is_table()) {
        config.janitor.enabled = janitor["enabled"].value_or(true);
        config.janitor.interval_ms = count(janitor, "janitor", "interval_ms",
                                           config.janitor.interval_ms);
    }

    // [logging]
    if (auto logging = tbl["logging"]; logging.is_table()) {
        auto& out = config.logging;
        out.level = logging["level"].value_or(std::string{"info"});
        out.log_to_file = logging["log_to_file"].value_or(false);
        out.log_dir = logging["log_dir"].value_or(std::string{"./logs"});
        out.log_to_console = logging["log_to_console"].value_or(true);
        out.max_file_size_mb = count(logging, "logging", "max_file_size_mb", out.max_file_size_mb);
        out.rotate_count = count(logging, "logging", "rotate_count", out.rotate_count);
        out.queue_capacity = count(logging, "logging", "queue_capacity", out.queue_capacity);
        out.drain_timeout_ms = count(logging, "logging", "drain_timeout_ms", out.drain_timeout_ms);
    }

    if (failure) return *failure;
    return config;
}

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::ConfigError, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return read_config(tbl).and_then(validate_config);

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<Config> validate_config(Config config) {
    if (config.executor.max_workers == 0) {
        return Error{ErrorCode::ConfigError, "executor.max_workers must be greater than 0"};
    }
    if (config.executor.trace_throttle_every == 0) {
        return Error{ErrorCode::ConfigError, "executor.trace_throttle_every must be greater than 0"};
    }
    if (!parse_log_level(config.logging.level)) {
        return Error{ErrorCode::ConfigError, "Unknown logging.level: " + config.logging.level};
    }
    return config;
}

Config default_config() {
    return Config{};
}

}  // namespace async_executor
