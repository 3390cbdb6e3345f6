/**
 * @file sinks.cpp
 * @brief Log sink implementations.
 * @author Dimitris Kafetzis
 */

#include "telemetry/sinks.hpp"

#include <iostream>
#include <stdexcept>
#include <system_error>

namespace async_executor {

// ── RotatingFileSink ─────────────────────────

RotatingFileSink::RotatingFileSink(const std::filesystem::path& log_dir,
                                   const std::string& prefix,
                                   uint32_t max_file_size_mb,
                                   uint32_t max_files)
    : log_dir_(log_dir)
    , prefix_(prefix)
    , max_file_size_bytes_(static_cast<uint64_t>(max_file_size_mb) * 1024 * 1024)
    , max_files_(max_files) {
    std::filesystem::create_directories(log_dir_);
    open_current();
}

RotatingFileSink::~RotatingFileSink() {
    if (current_file_.is_open()) {
        current_file_.flush();
        current_file_.close();
    }
}

void RotatingFileSink::write(const LogRecord& record) {
    rotate_if_needed();
    if (!current_file_.is_open()) {
        throw std::runtime_error("log file not open: " + current_path().string());
    }
    auto line = format_json(record);
    current_file_ << line << '\n';
    current_size_ += line.size() + 1;
}

void RotatingFileSink::flush() {
    if (current_file_.is_open()) {
        current_file_.flush();
    }
}

std::filesystem::path RotatingFileSink::current_path() const {
    return log_dir_ / (prefix_ + ".ndjson");
}

std::filesystem::path RotatingFileSink::rotated_path(uint32_t index) const {
    return log_dir_ / (prefix_ + "." + std::to_string(index) + ".ndjson");
}

void RotatingFileSink::open_current() {
    auto path = current_path();
    std::error_code ec;
    auto existing = std::filesystem::exists(path, ec)
        ? std::filesystem::file_size(path, ec) : 0;
    current_size_ = ec ? 0 : existing;
    current_file_.open(path, std::ios::app);
}

void RotatingFileSink::rotate_if_needed() {
    if (max_file_size_bytes_ == 0 || current_size_ < max_file_size_bytes_) return;

    current_file_.flush();
    current_file_.close();

    std::error_code ec;
    if (max_files_ == 0) {
        std::filesystem::remove(current_path(), ec);
    } else {
        // Shift <prefix>.N-1 -> <prefix>.N, dropping the oldest.
        std::filesystem::remove(rotated_path(max_files_), ec);
        for (uint32_t i = max_files_; i > 1; --i) {
            if (std::filesystem::exists(rotated_path(i - 1), ec)) {
                std::filesystem::rename(rotated_path(i - 1), rotated_path(i), ec);
            }
        }
        std::filesystem::rename(current_path(), rotated_path(1), ec);
    }

    open_current();
}

// ── ConsoleSink ──────────────────────────────

ConsoleSink::ConsoleSink() : out_(&std::cout) {}

ConsoleSink::ConsoleSink(std::ostream& out) : out_(&out) {}

void ConsoleSink::write(const LogRecord& record) {
    *out_ << format_text(record) << '\n';
}

void ConsoleSink::flush() {
    out_->flush();
}

// ── CallbackSink ─────────────────────────────

CallbackSink::CallbackSink(std::function<void(const LogRecord&)> callback)
    : callback_(std::move(callback)) {}

void CallbackSink::write(const LogRecord& record) {
    callback_(record);
}

}  // namespace async_executor
