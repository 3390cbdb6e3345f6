/**
 * @file test_janitor.cpp
 * @brief Unit tests for the periodic registry Janitor.
 */

#include "executor/executor.hpp"
#include "executor/janitor.hpp"
#include "telemetry/log_pipeline.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace async_executor;
using namespace std::chrono_literals;

namespace {

/// Auditor over a registry the test populates directly.
class FakeAuditor : public IRegistryAuditor {
public:
    CancellationRegistry registry;
    std::vector<TaskId> overdue;
    std::atomic<int> audits{0};

    RegistryAudit audit_registry() override {
        ++audits;
        RegistryAudit audit;
        audit.anomalies = registry.sweep();
        audit.long_running = overdue;
        audit.pool.tracked_count = registry.size();
        return audit;
    }
};

}  // namespace

class JanitorTest : public ::testing::Test {
protected:
    std::mutex records_mutex_;
    std::vector<LogRecord> records_;
    LogPipeline pipeline_;

    void SetUp() override {
        pipeline_.register_sink([this](const LogRecord& r) {
            std::lock_guard lock(records_mutex_);
            records_.push_back(r);
        });
    }

    Logger logger() { return Logger(&pipeline_, "janitor", LogLevel::Debug); }

    size_t warnings_containing(std::string_view text) {
        EXPECT_TRUE(pipeline_.flush(2s));
        std::lock_guard lock(records_mutex_);
        return static_cast<size_t>(std::count_if(records_.begin(), records_.end(),
            [text](const LogRecord& r) {
                return r.level == LogLevel::Warn && r.message.find(text) != std::string::npos;
            }));
    }
};

TEST_F(JanitorTest, RemovesExpiredAndTerminalEntriesAndLogsThem) {
    FakeAuditor auditor;
    auto live = std::make_shared<TaskHandle>("live", "", std::nullopt);
    auto finished = std::make_shared<TaskHandle>("finished", "", std::nullopt);
    auditor.registry.add(live);
    auditor.registry.add(finished);
    {
        auto dropped = std::make_shared<TaskHandle>("dropped", "", std::nullopt);
        auditor.registry.add(dropped);
    }
    finished->request_cancel();

    Janitor janitor(auditor, logger(), 1h);
    auto report = janitor.tick();

    EXPECT_EQ(report.anomalies, 2u);
    EXPECT_EQ(auditor.registry.size(), 1u);
    EXPECT_EQ(warnings_containing("Registry inconsistency"), 2u);

    // Nothing left to clean: a second pass is a no-op.
    EXPECT_EQ(janitor.tick().anomalies, 0u);
    EXPECT_EQ(warnings_containing("Registry inconsistency"), 2u);
    EXPECT_EQ(live->state(), TaskState::Pending);
}

TEST_F(JanitorTest, WarnsOncePerOverdueTask) {
    FakeAuditor auditor;
    auditor.overdue = {"task_7"};

    Janitor janitor(auditor, logger(), 1h);
    EXPECT_EQ(janitor.tick().newly_overdue, std::vector<TaskId>{"task_7"});
    EXPECT_TRUE(janitor.tick().newly_overdue.empty());
    EXPECT_EQ(warnings_containing("advisory timeout"), 1u);

    // Once it stops being overdue, a later overrun is reported again.
    auditor.overdue.clear();
    janitor.tick();
    auditor.overdue = {"task_7"};
    EXPECT_EQ(janitor.tick().newly_overdue.size(), 1u);
    EXPECT_EQ(janitor.ticks(), 4u);
}

TEST_F(JanitorTest, RunsPeriodicallyAndStopsIdempotently) {
    FakeAuditor auditor;
    Janitor janitor(auditor, logger(), 10ms);
    janitor.start();
    EXPECT_TRUE(janitor.running());

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (auditor.audits.load() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_GE(auditor.audits.load(), 3);

    janitor.stop();
    EXPECT_FALSE(janitor.running());
    EXPECT_NO_THROW(janitor.stop());

    auto after_stop = auditor.audits.load();
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(auditor.audits.load(), after_stop);
}

TEST_F(JanitorTest, StopInterruptsLongInterval) {
    FakeAuditor auditor;
    Janitor janitor(auditor, logger(), 1h);
    janitor.start();

    auto started = std::chrono::steady_clock::now();
    janitor.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - started, 1s);
    EXPECT_EQ(auditor.audits.load(), 0);
}

TEST_F(JanitorTest, ReportsTasksPastAdvisoryTimeoutOnExecutor) {
    ExecutorConfig config;
    config.max_workers = 1;
    Executor executor(config, pipeline_, JanitorConfig{.enabled = false}, LogLevel::Debug);

    std::atomic<bool> release{false};
    auto submitted = executor.submit(SubmitOptions{.timeout_seconds = 0}, [&release] {
        while (!release.load()) std::this_thread::sleep_for(1ms);
    });
    ASSERT_TRUE(submitted);
    while (submitted->handle->state() != TaskState::Running) std::this_thread::sleep_for(1ms);
    std::this_thread::sleep_for(5ms);

    Janitor janitor(executor, logger(), 1h);
    auto report = janitor.tick();
    EXPECT_EQ(report.anomalies, 0u);
    EXPECT_EQ(report.newly_overdue, std::vector<TaskId>{submitted->id});
    EXPECT_EQ(report.pool.active_count, 1u);
    EXPECT_EQ(submitted->handle->state(), TaskState::Running);

    release = true;
    ASSERT_TRUE(executor.wait_for_completion(2s));
    EXPECT_EQ(warnings_containing("advisory timeout"), 1u);
    executor.shutdown();
}
