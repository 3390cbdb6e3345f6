/**
 * @file logger.cpp
 * @brief Record formatting with ISO 8601 timestamps and the Logger front-end.
 * @author Dimitris Kafetzis
 */

#include "core/logger.hpp"

#include "telemetry/log_pipeline.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace async_executor {

namespace {

void write_timestamp(std::ostream& os, std::chrono::system_clock::time_point tp) {
    auto time_t_tp = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t_tp, &utc);
    os << std::put_time(&utc, "%FT%T")
       << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
}

void write_json_escaped(std::ostream& os, std::string_view text) {
    for (char c : text) {
        switch (c) {
            case '"':  os << "\\\""; break;
            case '\\': os << "\\\\"; break;
            case '\n': os << "\\n"; break;
            case '\r': os << "\\r"; break;
            case '\t': os << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    os << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(c) << std::dec << std::setfill(' ');
                } else {
                    os << c;
                }
        }
    }
}

}  // namespace

std::optional<LogLevel> parse_log_level(std::string_view text) noexcept {
    if (text == "debug") return LogLevel::Debug;
    if (text == "info") return LogLevel::Info;
    if (text == "warn" || text == "warning") return LogLevel::Warn;
    if (text == "error") return LogLevel::Error;
    return std::nullopt;
}

// ── LogRecord ────────────────────────────────

LogRecord LogRecord::make(LogLevel level, std::string message, std::string component) {
    return LogRecord{
        .level = level,
        .message = std::move(message),
        .timestamp = std::chrono::system_clock::now(),
        .source_thread = std::this_thread::get_id(),
        .component = std::move(component)
    };
}

std::string format_json(const LogRecord& record) {
    std::ostringstream oss;
    oss << R"({"level":")" << to_string(record.level) << R"(",)"
        << R"("ts":")";
    write_timestamp(oss, record.timestamp);
    oss << R"(",)"
        << R"("thread":")" << record.source_thread << R"(",)"
        << R"("component":")";
    write_json_escaped(oss, record.component);
    oss << R"(",)"
        << R"("msg":")";
    write_json_escaped(oss, record.message);
    oss << R"("})";
    return oss.str();
}

std::string format_text(const LogRecord& record) {
    std::string level{to_string(record.level)};
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    std::ostringstream oss;
    write_timestamp(oss, record.timestamp);
    oss << " - " << (record.component.empty() ? "app" : record.component)
        << " - " << level
        << " - " << record.message;
    return oss.str();
}

// ── Logger ───────────────────────────────────

Logger::Logger(LogPipeline* pipeline, std::string component, LogLevel min_level)
    : pipeline_(pipeline), component_(std::move(component)), min_level_(min_level) {}

void Logger::debug(std::string_view message) const { log(LogLevel::Debug, message); }
void Logger::info(std::string_view message) const  { log(LogLevel::Info, message); }
void Logger::warn(std::string_view message) const  { log(LogLevel::Warn, message); }
void Logger::error(std::string_view message) const { log(LogLevel::Error, message); }

void Logger::log(LogLevel level, std::string_view message) const {
    if (!enabled(level)) return;
    // Dropped records are counted by the pipeline itself.
    (void)pipeline_->enqueue(LogRecord::make(level, std::string{message}, component_));
}

bool Logger::enabled(LogLevel level) const noexcept {
    return pipeline_ != nullptr && level >= min_level_;
}

void Logger::set_level(LogLevel level) noexcept { min_level_ = level; }
LogLevel Logger::level() const noexcept { return min_level_; }

Logger Logger::with_component(std::string component) const {
    return Logger(pipeline_, std::move(component), min_level_);
}

}  // namespace async_executor
