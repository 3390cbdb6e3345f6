/**
 * @file log_pipeline.cpp
 * @brief LogPipeline implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/log_pipeline.hpp"

#include "telemetry/sinks.hpp"

#include <exception>
#include <iterator>
#include <new>
#include <string>
#include <utility>

namespace async_executor {

LogPipeline::LogPipeline(PipelineOptions options)
    : options_(options) {
    consumer_ = std::jthread([this](std::stop_token stop) {
        consumer_loop(stop);
    });
}

LogPipeline::~LogPipeline() {
    stop();
}

// ─────────────────────────────────────────────
// Producer side
// ─────────────────────────────────────────────

bool LogPipeline::enqueue(LogRecord record) noexcept {
    try {
        {
            std::lock_guard lock(queue_mutex_);
            if (!accepting_) {
                dropped_.fetch_add(1, std::memory_order_relaxed);
                return false;
            }
            if (options_.queue_capacity > 0 && queue_.size() >= options_.queue_capacity) {
                dropped_.fetch_add(1, std::memory_order_relaxed);
                return false;
            }
            queue_.push_back(Entry{++next_seq_, std::move(record)});
        }
        enqueued_.fetch_add(1, std::memory_order_relaxed);
        queue_cv_.notify_one();
        return true;
    } catch (const std::bad_alloc&) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
}

void LogPipeline::register_sink(std::unique_ptr<ILogSink> sink) {
    if (!sink) return;
    std::lock_guard lock(sinks_mutex_);
    sinks_.push_back(std::move(sink));
}

void LogPipeline::register_sink(SinkFunction sink) {
    if (!sink) return;
    register_sink(std::make_unique<CallbackSink>(std::move(sink)));
}

bool LogPipeline::flush(std::chrono::milliseconds timeout) {
    uint64_t target = 0;
    {
        std::lock_guard lock(queue_mutex_);
        if (!accepting_) return false;
        target = next_seq_;
        flush_requested_ = true;
    }
    queue_cv_.notify_one();

    std::unique_lock lock(progress_mutex_);
    return progress_cv_.wait_for(lock, timeout, [this, target] {
        return flushed_seq_ >= target || stopped_.load();
    }) && flushed_seq_ >= target;
}

// ─────────────────────────────────────────────
// Shutdown
// ─────────────────────────────────────────────

void LogPipeline::stop() {
    stop(options_.drain_timeout);
}

void LogPipeline::stop(std::chrono::milliseconds grace) {
    std::lock_guard stop_lock(stop_mutex_);
    if (stopped_.load()) return;

    {
        std::lock_guard lock(queue_mutex_);
        accepting_ = false;
        drain_deadline_ = std::chrono::steady_clock::now() + grace;
    }

    if (consumer_.joinable()) {
        consumer_.request_stop();
        queue_cv_.notify_all();
        consumer_.join();
    }

    stopped_.store(true);
    progress_cv_.notify_all();
}

bool LogPipeline::stopped() const noexcept {
    return stopped_.load();
}

PipelineStats LogPipeline::stats() const {
    PipelineStats out;
    {
        std::lock_guard lock(queue_mutex_);
        out.queue_depth = queue_.size();
    }
    out.enqueued = enqueued_.load();
    out.delivered = delivered_.load();
    out.dropped = dropped_.load();
    out.sink_errors = sink_errors_.load();
    {
        std::lock_guard lock(sinks_mutex_);
        out.sink_count = sinks_.size();
    }

    if (stopped_.load()) {
        out.health = PipelineHealth::Stopped;
    } else if (out.dropped > 0 || out.sink_errors > 0) {
        out.health = PipelineHealth::Degraded;
    }
    return out;
}

// ─────────────────────────────────────────────
// Consumer Thread
// ─────────────────────────────────────────────

void LogPipeline::consumer_loop(std::stop_token stop) {
    std::deque<Entry> batch;

    while (true) {
        bool exiting = false;
        bool flush_now = false;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] {
                return !queue_.empty() || flush_requested_;
            });

            if (stop.stop_requested()) {
                // Draining: whatever is still queued is the final batch.
                exiting = true;
            }
            batch.swap(queue_);
            flush_now = std::exchange(flush_requested_, false);
        }

        uint64_t last_seq = 0;
        for (auto it = batch.begin(); it != batch.end(); ++it) {
            // stop() writes drain_deadline_ before request_stop(), so it is
            // visible once the stop request is. This also bounds a batch
            // that was already being delivered when stop() arrived.
            if (stop.stop_requested() && std::chrono::steady_clock::now() >= drain_deadline_) {
                auto remaining = static_cast<uint64_t>(std::distance(it, batch.end()));
                dropped_.fetch_add(remaining, std::memory_order_relaxed);
                break;
            }
            dispatch(it->record);
            delivered_.fetch_add(1, std::memory_order_relaxed);
            last_seq = it->seq;
        }
        batch.clear();

        if (flush_now || exiting) {
            flush_sinks();
        }
        publish_progress(last_seq, flush_now || exiting);

        if (exiting) break;
    }
}

void LogPipeline::dispatch(const LogRecord& record) {
    std::lock_guard lock(sinks_mutex_);
    for (size_t i = 0; i < sinks_.size(); ++i) {
        try {
            sinks_[i]->write(record);
        } catch (const std::exception& e) {
            report_sink_failure(i, e.what());
        } catch (...) {
            report_sink_failure(i, "non-standard exception");
        }
    }
}

// Caller holds sinks_mutex_.
void LogPipeline::report_sink_failure(size_t failed_index, std::string_view what) {
    sink_errors_.fetch_add(1, std::memory_order_relaxed);

    auto meta = LogRecord::make(
        LogLevel::Error,
        "Sink #" + std::to_string(failed_index) + " failed: " + std::string{what},
        "pipeline");

    for (size_t i = 0; i < sinks_.size(); ++i) {
        if (i == failed_index) continue;
        try {
            sinks_[i]->write(meta);
        } catch (const std::exception&) {
            // Not reported again; a second failure is already in sink_errors_.
            sink_errors_.fetch_add(1, std::memory_order_relaxed);
        } catch (...) {
            sink_errors_.fetch_add(1, std::memory_order_relaxed);
        }
    }
}

void LogPipeline::flush_sinks() {
    std::lock_guard lock(sinks_mutex_);
    for (size_t i = 0; i < sinks_.size(); ++i) {
        try {
            sinks_[i]->flush();
        } catch (const std::exception& e) {
            report_sink_failure(i, e.what());
        } catch (...) {
            report_sink_failure(i, "non-standard exception");
        }
    }
}

void LogPipeline::publish_progress(uint64_t delivered_seq, bool flushed) {
    {
        std::lock_guard lock(progress_mutex_);
        if (delivered_seq > delivered_seq_) delivered_seq_ = delivered_seq;
        if (flushed) flushed_seq_ = delivered_seq_;
    }
    progress_cv_.notify_all();
}

}  // namespace async_executor
