/**
 * @file test_log_pipeline.cpp
 * @brief Unit tests for LogPipeline ordering, isolation and shutdown.
 */

#include "telemetry/log_pipeline.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace async_executor;
using namespace std::chrono_literals;

namespace {

/// Thread-safe capture of every record a sink receives.
struct Capture {
    std::mutex mutex;
    std::vector<LogRecord> records;

    SinkFunction sink() {
        return [this](const LogRecord& r) {
            std::lock_guard lock(mutex);
            records.push_back(r);
        };
    }

    std::vector<std::string> messages() {
        std::lock_guard lock(mutex);
        std::vector<std::string> out;
        for (const auto& r : records) out.push_back(r.message);
        return out;
    }
};

LogRecord record(std::string msg, LogLevel level = LogLevel::Info) {
    return LogRecord::make(level, std::move(msg), "test");
}

}  // namespace

TEST(LogPipelineTest, PreservesEnqueueOrderForEverySink) {
    LogPipeline pipeline;
    Capture first, second;
    pipeline.register_sink(first.sink());
    pipeline.register_sink(second.sink());

    for (int i = 0; i < 200; ++i) {
        ASSERT_TRUE(pipeline.enqueue(record("m" + std::to_string(i))));
    }
    ASSERT_TRUE(pipeline.flush(2s));

    auto a = first.messages();
    auto b = second.messages();
    ASSERT_EQ(a.size(), 200u);
    EXPECT_EQ(a, b);
    for (int i = 0; i < 200; ++i) EXPECT_EQ(a[i], "m" + std::to_string(i));
}

TEST(LogPipelineTest, PerThreadOrderSurvivesConcurrentProducers) {
    LogPipeline pipeline;
    Capture capture;
    pipeline.register_sink(capture.sink());

    constexpr int kThreads = 4;
    constexpr int kPerThread = 250;
    {
        std::vector<std::jthread> producers;
        for (int t = 0; t < kThreads; ++t) {
            producers.emplace_back([&pipeline, t] {
                for (int i = 0; i < kPerThread; ++i) {
                    pipeline.enqueue(record(std::to_string(t) + ":" + std::to_string(i)));
                }
            });
        }
    }
    ASSERT_TRUE(pipeline.flush(5s));

    std::vector<int> next(kThreads, 0);
    for (const auto& msg : capture.messages()) {
        auto colon = msg.find(':');
        int t = std::stoi(msg.substr(0, colon));
        int i = std::stoi(msg.substr(colon + 1));
        EXPECT_EQ(i, next[t]) << "thread " << t << " out of order";
        next[t] = i + 1;
    }
    for (int t = 0; t < kThreads; ++t) EXPECT_EQ(next[t], kPerThread);
}

TEST(LogPipelineTest, ThrowingSinkDoesNotBlockLaterSinks) {
    LogPipeline pipeline;
    pipeline.register_sink([](const LogRecord&) {
        throw std::runtime_error("disk on fire");
    });
    Capture good;
    pipeline.register_sink(good.sink());

    pipeline.enqueue(record("hello"));
    ASSERT_TRUE(pipeline.flush(2s));

    std::lock_guard lock(good.mutex);
    ASSERT_EQ(good.records.size(), 2u);
    // Meta-error emitted on behalf of the failing sink, then the record itself.
    EXPECT_EQ(good.records[0].level, LogLevel::Error);
    EXPECT_EQ(good.records[0].component, "pipeline");
    EXPECT_NE(good.records[0].message.find("disk on fire"), std::string::npos);
    EXPECT_EQ(good.records[1].message, "hello");

    auto stats = pipeline.stats();
    EXPECT_EQ(stats.sink_errors, 1u);
    EXPECT_EQ(stats.delivered, 1u);
    EXPECT_EQ(stats.health, PipelineHealth::Degraded);
}

TEST(LogPipelineTest, DropsAfterStop) {
    LogPipeline pipeline;
    Capture capture;
    pipeline.register_sink(capture.sink());

    pipeline.enqueue(record("before"));
    pipeline.stop();

    EXPECT_FALSE(pipeline.enqueue(record("after")));
    EXPECT_TRUE(pipeline.stopped());

    auto stats = pipeline.stats();
    EXPECT_EQ(stats.dropped, 1u);
    EXPECT_EQ(stats.health, PipelineHealth::Stopped);
    EXPECT_EQ(capture.messages(), std::vector<std::string>{"before"});
}

TEST(LogPipelineTest, StopDrainsQueuedRecords) {
    LogPipeline pipeline;
    Capture capture;
    pipeline.register_sink(capture.sink());

    for (int i = 0; i < 100; ++i) pipeline.enqueue(record(std::to_string(i)));
    pipeline.stop(2s);

    EXPECT_EQ(capture.messages().size(), 100u);
    EXPECT_EQ(pipeline.stats().queue_depth, 0u);
}

TEST(LogPipelineTest, StopBoundsBatchAlreadyInDelivery) {
    LogPipeline pipeline;

    std::atomic<bool> release{false};
    std::atomic<int> seen{0};
    pipeline.register_sink([&](const LogRecord&) {
        if (seen.fetch_add(1) == 0) {
            while (!release.load()) std::this_thread::sleep_for(1ms);
        } else {
            std::this_thread::sleep_for(5ms);
        }
    });

    // The consumer is stuck on the first record while the rest queue up,
    // so they are picked up later as one batch.
    ASSERT_TRUE(pipeline.enqueue(record("blocker")));
    while (seen.load() == 0) std::this_thread::sleep_for(1ms);
    for (int i = 0; i < 200; ++i) pipeline.enqueue(record(std::to_string(i)));

    release = true;
    while (seen.load() < 3) std::this_thread::sleep_for(1ms);

    auto start = std::chrono::steady_clock::now();
    pipeline.stop(50ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, 500ms);
    auto stats = pipeline.stats();
    EXPECT_GT(stats.dropped, 0u);
    EXPECT_EQ(stats.delivered + stats.dropped, 201u);
}

TEST(LogPipelineTest, StopIsIdempotent) {
    LogPipeline pipeline;
    pipeline.stop();
    EXPECT_NO_THROW(pipeline.stop());
    EXPECT_FALSE(pipeline.flush(10ms));
}

TEST(LogPipelineTest, BoundedQueueDropsWhenFull) {
    LogPipeline pipeline(PipelineOptions{.queue_capacity = 2});

    std::atomic<bool> release{false};
    std::atomic<int> seen{0};
    pipeline.register_sink([&](const LogRecord&) {
        ++seen;
        while (!release.load()) std::this_thread::sleep_for(1ms);
    });

    // First record occupies the consumer.
    ASSERT_TRUE(pipeline.enqueue(record("blocker")));
    while (seen.load() == 0) std::this_thread::sleep_for(1ms);

    EXPECT_TRUE(pipeline.enqueue(record("a")));
    EXPECT_TRUE(pipeline.enqueue(record("b")));
    EXPECT_FALSE(pipeline.enqueue(record("c")));
    EXPECT_EQ(pipeline.stats().dropped, 1u);

    release = true;
    ASSERT_TRUE(pipeline.flush(2s));
    EXPECT_EQ(pipeline.stats().delivered, 3u);
}

TEST(LogPipelineTest, LateSinkSeesOnlyLaterRecords) {
    LogPipeline pipeline;
    Capture early, late;
    pipeline.register_sink(early.sink());

    pipeline.enqueue(record("one"));
    ASSERT_TRUE(pipeline.flush(2s));

    pipeline.register_sink(late.sink());
    pipeline.enqueue(record("two"));
    ASSERT_TRUE(pipeline.flush(2s));

    EXPECT_EQ(early.messages(), (std::vector<std::string>{"one", "two"}));
    EXPECT_EQ(late.messages(), std::vector<std::string>{"two"});
}

TEST(LoggerTest, FiltersBelowMinimumLevel) {
    LogPipeline pipeline;
    Capture capture;
    pipeline.register_sink(capture.sink());

    Logger logger(&pipeline, "executor", LogLevel::Warn);
    logger.debug("hidden");
    logger.info("hidden");
    logger.warn("shown");
    logger.with_component("janitor").error("also shown");
    ASSERT_TRUE(pipeline.flush(2s));

    std::lock_guard lock(capture.mutex);
    ASSERT_EQ(capture.records.size(), 2u);
    EXPECT_EQ(capture.records[0].component, "executor");
    EXPECT_EQ(capture.records[1].component, "janitor");
    EXPECT_EQ(capture.records[1].level, LogLevel::Error);
}

TEST(LoggerTest, DetachedLoggerDiscards) {
    Logger logger;
    EXPECT_FALSE(logger.enabled(LogLevel::Error));
    EXPECT_NO_THROW(logger.error("nowhere"));
}

TEST(LogFormatTest, JsonEscapesAndCarriesFields) {
    auto r = LogRecord::make(LogLevel::Warn, "say \"hi\"\n", "exec");
    auto line = format_json(r);
    EXPECT_NE(line.find(R"("level":"warn")"), std::string::npos);
    EXPECT_NE(line.find(R"("component":"exec")"), std::string::npos);
    EXPECT_NE(line.find(R"("msg":"say \"hi\"\n")"), std::string::npos);
    EXPECT_NE(line.find(R"("ts":")"), std::string::npos);
}

TEST(LogFormatTest, TextLine) {
    auto r = LogRecord::make(LogLevel::Error, "boom", "");
    auto line = format_text(r);
    EXPECT_NE(line.find(" - app - ERROR - boom"), std::string::npos);
}

TEST(LogLevelTest, Parse) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_FALSE(parse_log_level("loud").has_value());
}
