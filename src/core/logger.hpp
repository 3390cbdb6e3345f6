/**
 * @file logger.hpp
 * @brief Log records, pluggable sinks and the Logger front-end.
 * @author Dimitris Kafetzis
 *
 * Provides LogRecord (immutable unit of delivery), ILogSink (virtual
 * interface for runtime-configurable log destinations) and a cheap Logger
 * front-end that stamps records and hands them to a LogPipeline. Sinks use
 * virtual dispatch because they are configured once at startup and only
 * ever called from the pipeline's consumer thread.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace async_executor {

class LogPipeline;

// ─────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────

enum class LogLevel : uint8_t {
    Debug,
    Info,
    Warn,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

/// Parse "debug" / "info" / "warn" / "warning" / "error" (case-sensitive).
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text) noexcept;

// ─────────────────────────────────────────────
// LogRecord
// ─────────────────────────────────────────────

/**
 * @brief One log event. Immutable once constructed; enqueued once,
 *        consumed once.
 */
struct LogRecord {
    LogLevel level{LogLevel::Info};
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id source_thread;
    std::string component;

    /// Stamp a record with the current time and calling thread.
    static LogRecord make(LogLevel level, std::string message, std::string component = {});
};

/// NDJSON line: {"level":..,"ts":..,"thread":..,"component":..,"msg":..}
[[nodiscard]] std::string format_json(const LogRecord& record);

/// Human readable line: "<ts> - <component> - <LEVEL> - <msg>"
[[nodiscard]] std::string format_text(const LogRecord& record);

// ─────────────────────────────────────────────
// ILogSink (virtual, runtime-configurable)
// ─────────────────────────────────────────────

/**
 * @brief Abstract interface for log output destinations.
 *
 * Implementations are only invoked from the LogPipeline consumer thread and
 * need no locking of their own. They may throw; the pipeline isolates them.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

// ─────────────────────────────────────────────
// Logger
// ─────────────────────────────────────────────

/**
 * @brief Per-component logger front-end.
 *
 * Copyable; holds a non-owning pointer to the pipeline, which must outlive
 * it. Producing a record never blocks beyond queue insertion. A Logger with
 * no pipeline discards everything.
 */
class Logger {
public:
    Logger() = default;
    explicit Logger(LogPipeline* pipeline,
                    std::string component = {},
                    LogLevel min_level = LogLevel::Info);

    void debug(std::string_view message) const;
    void info(std::string_view message) const;
    void warn(std::string_view message) const;
    void error(std::string_view message) const;

    void log(LogLevel level, std::string_view message) const;

    [[nodiscard]] bool enabled(LogLevel level) const noexcept;
    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;

    /// Same pipeline and level, different component name.
    [[nodiscard]] Logger with_component(std::string component) const;

private:
    LogPipeline* pipeline_{nullptr};
    std::string component_;
    LogLevel min_level_{LogLevel::Info};
};

}  // namespace async_executor
