/**
 * @file sinks.hpp
 * @brief Log sink implementations: rotating NDJSON file, console, callback.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iosfwd>
#include <string>

namespace async_executor {

/**
 * @brief Writes NDJSON to size-rotated log files.
 *
 * The active file is `<dir>/<prefix>.ndjson`; rotated files are
 * `<prefix>.1.ndjson` (newest) up to `<prefix>.<max_files>.ndjson`.
 */
class RotatingFileSink : public ILogSink {
public:
    RotatingFileSink(const std::filesystem::path& log_dir,
                     const std::string& prefix,
                     uint32_t max_file_size_mb = 10,
                     uint32_t max_files = 5);
    ~RotatingFileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    [[nodiscard]] std::filesystem::path current_path() const;

private:
    void open_current();
    void rotate_if_needed();
    [[nodiscard]] std::filesystem::path rotated_path(uint32_t index) const;

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Human readable lines to a stream (stdout by default).
 */
class ConsoleSink : public ILogSink {
public:
    ConsoleSink();
    explicit ConsoleSink(std::ostream& out);

    void write(const LogRecord& record) override;
    void flush() override;

private:
    std::ostream* out_;
};

/**
 * @brief Forwards records to a callable, e.g. a UI console widget.
 */
class CallbackSink : public ILogSink {
public:
    explicit CallbackSink(std::function<void(const LogRecord&)> callback);

    void write(const LogRecord& record) override;
    void flush() override {}

private:
    std::function<void(const LogRecord&)> callback_;
};

/**
 * @brief Discards all output. Used by the benchmarks.
 */
class NullSink : public ILogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

}  // namespace async_executor
