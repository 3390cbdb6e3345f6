/**
 * @file log_pipeline.hpp
 * @brief Multi-producer, single-consumer ordered log delivery.
 * @author Dimitris Kafetzis
 *
 * Producers (any worker or Executor thread) append LogRecords to one
 * mutex-guarded queue, which is therefore a single total order. A dedicated
 * consumer thread (std::jthread) drains the queue in batches and hands each
 * record to every registered sink in registration order. Producers never
 * wait for sink I/O.
 */

#pragma once

#include "core/logger.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>
#include <vector>

namespace async_executor {

using SinkFunction = std::function<void(const LogRecord&)>;

struct PipelineOptions {
    size_t queue_capacity = 0;                              ///< 0 = unbounded
    std::chrono::milliseconds drain_timeout{5000};          ///< Default grace for stop()
};

enum class PipelineHealth : uint8_t {
    Healthy,
    Degraded,      ///< Records dropped or sinks failing
    Stopped
};

[[nodiscard]] constexpr std::string_view to_string(PipelineHealth health) noexcept {
    switch (health) {
        case PipelineHealth::Healthy:  return "healthy";
        case PipelineHealth::Degraded: return "degraded";
        case PipelineHealth::Stopped:  return "stopped";
    }
    return "unknown";
}

struct PipelineStats {
    uint64_t enqueued{0};
    uint64_t delivered{0};
    uint64_t dropped{0};
    uint64_t sink_errors{0};
    size_t queue_depth{0};
    size_t sink_count{0};
    PipelineHealth health{PipelineHealth::Healthy};
};

/**
 * @brief Ordered, non-blocking log delivery to a set of sinks.
 *
 * Sinks may be registered at any time; a sink registered while records are
 * in flight only sees records dispatched after its registration. A sink
 * must not call register_sink() or stop() on its own pipeline.
 */
class LogPipeline {
public:
    explicit LogPipeline(PipelineOptions options = {});
    ~LogPipeline();

    // Non-copyable, non-movable
    LogPipeline(const LogPipeline&) = delete;
    LogPipeline& operator=(const LogPipeline&) = delete;

    /**
     * @brief Append a record. Never blocks on sinks and never throws.
     * @return false if the record was dropped (pipeline stopped or full).
     */
    bool enqueue(LogRecord record) noexcept;

    void register_sink(std::unique_ptr<ILogSink> sink);
    void register_sink(SinkFunction sink);

    /**
     * @brief Wait until every record enqueued before this call has been
     *        delivered and all sinks flushed.
     * @return false on timeout or if the pipeline is stopped.
     */
    bool flush(std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});

    /// Idempotent. Drains within the configured grace period, then joins.
    void stop();
    void stop(std::chrono::milliseconds grace);

    [[nodiscard]] bool stopped() const noexcept;
    [[nodiscard]] PipelineStats stats() const;

private:
    struct Entry {
        uint64_t seq;
        LogRecord record;
    };

    void consumer_loop(std::stop_token stop);
    void dispatch(const LogRecord& record);
    void report_sink_failure(size_t failed_index, std::string_view what);
    void flush_sinks();
    void publish_progress(uint64_t delivered_seq, bool flushed);

    PipelineOptions options_;

    // Producer side
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::deque<Entry> queue_;
    uint64_t next_seq_{0};
    bool accepting_{true};
    bool flush_requested_{false};
    std::chrono::steady_clock::time_point drain_deadline_{};

    // Consumer progress (for flush())
    mutable std::mutex progress_mutex_;
    std::condition_variable progress_cv_;
    uint64_t delivered_seq_{0};
    uint64_t flushed_seq_{0};

    // Sinks, touched by the consumer and by register_sink()
    mutable std::mutex sinks_mutex_;
    std::vector<std::unique_ptr<ILogSink>> sinks_;

    std::atomic<uint64_t> enqueued_{0};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> sink_errors_{0};

    std::mutex stop_mutex_;
    std::atomic<bool> stopped_{false};

    std::jthread consumer_;
};

}  // namespace async_executor
