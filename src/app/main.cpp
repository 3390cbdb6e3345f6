/**
 * @file main.cpp
 * @brief AsyncExecutor demo daemon entry point.
 * @author Dimitris Kafetzis
 *
 * Wires all modules into a runnable demonstration:
 *   Config → LogPipeline + sinks → Executor (+ Janitor) → sample workload → shutdown
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/executor.hpp"
#include "executor/legacy_runner.hpp"
#include "telemetry/log_pipeline.hpp"
#include "telemetry/sinks.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using namespace async_executor;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║           AsyncExecutor v1.0.0            ║
  ║   Bounded Task Executor with Cooperative  ║
  ║   Cancellation and Ordered Logging        ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    uint32_t workers = 0;
    uint32_t tasks = 12;
    std::string log_dir;
    bool console = false;
};

uint32_t parse_count(const std::string& flag, const char* text) {
    try {
        size_t used = 0;
        long long value = std::stoll(text, &used);
        if (used == std::string_view{text}.size() && value >= 1 && value <= 100000) {
            return static_cast<uint32_t>(value);
        }
    } catch (const std::logic_error&) {
        // Not a number; falls through to the usage error.
    }
    std::cerr << flag << " expects a positive integer, got '" << text << "'" << std::endl;
    std::exit(2);
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--workers" && i + 1 < argc) {
            args.workers = parse_count(arg, argv[++i]);
        } else if (arg == "--tasks" && i + 1 < argc) {
            args.tasks = parse_count(arg, argv[++i]);
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--console") {
            args.console = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: async_executor_demo [OPTIONS]\n"
                      << "  --config <path>    Configuration file (default: config/default.toml)\n"
                      << "  --workers <n>      Override executor.max_workers\n"
                      << "  --tasks <n>        Number of sample tasks to submit (default: 12)\n"
                      << "  --log-dir <path>   Write NDJSON logs to this directory\n"
                      << "  --console          Force console logging\n"
                      << "  --help, -h         Show this help message\n";
            std::exit(0);
        }
    }
    return args;
}

/**
 * @brief Simulated unit of work that polls for cancellation every 10 ms.
 */
int simulated_work(TaskContext& ctx, int index, std::chrono::milliseconds duration) {
    auto deadline = std::chrono::steady_clock::now() + duration;
    int steps = 0;
    while (std::chrono::steady_clock::now() < deadline) {
        ctx.throw_if_cancelled();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        if (++steps % 10 == 0) {
            ctx.report_progress("step " + std::to_string(steps));
        }
    }
    return index * index;
}

/**
 * @brief Submit a mixed workload: normal, failing, cancelled and legacy tasks.
 */
void run_workload(Executor& executor, uint32_t task_count, Logger& logger) {
    std::vector<Submission> submissions;

    for (uint32_t i = 0; i < task_count && !g_shutdown_requested; ++i) {
        SubmitOptions options;
        options.name = "sample-" + std::to_string(i);
        options.timeout_seconds = 5;
        options.callbacks.on_completed = [&logger](const TaskHandle& h) {
            if (const auto* value = h.result_as<int>()) {
                logger.info(h.name() + " -> " + std::to_string(*value));
            }
        };
        options.callbacks.on_failed = [&logger](const TaskHandle& h) {
            logger.warn(h.name() + " failed: " + h.error_message().value_or("?"));
        };
        options.callbacks.on_progress = [&logger](const TaskHandle& h, std::string_view msg) {
            logger.debug(h.name() + ": " + std::string(msg));
        };

        auto duration = std::chrono::milliseconds(50 + 25 * (i % 4));
        auto submitted = executor.submit(std::move(options), simulated_work,
                                         static_cast<int>(i), duration);
        if (!submitted) {
            logger.error("Submission failed: " + submitted.error().message);
            return;
        }
        submissions.push_back(*submitted);
    }

    // One task that always fails
    auto failing = executor.submit(SubmitOptions{.name = "always-fails"}, [] {
        throw std::runtime_error("simulated failure");
    });
    if (!failing) logger.error("Submission failed: " + failing.error().message);

    // One long task that is cancelled while it runs
    auto long_task = executor.submit(SubmitOptions{.name = "long-running"},
                                     simulated_work, -1, std::chrono::milliseconds(10000));
    if (long_task) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        logger.info("Cancelling " + long_task->id + ": "
                    + (executor.cancel(long_task->id) ? "accepted" : "not found"));
    }

    // The fire-and-forget call style
    LegacyRunner legacy(executor);
    auto legacy_id = legacy.run_in_thread([&logger](const std::string& who) {
        logger.info("Legacy task says hello to " + who);
    }, std::string("demo"));
    if (legacy_id) logger.info("Legacy task submitted as " + *legacy_id);

    auto health = executor.health();
    logger.info("Health: " + std::string(to_string(health.status)) + ", load "
                + std::to_string(static_cast<int>(health.load_percentage)) + "%");
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result.value_or(default_config());

    // Apply CLI overrides
    if (args.workers != 0) config.executor.max_workers = args.workers;
    if (!args.log_dir.empty()) {
        config.logging.log_dir = args.log_dir;
        config.logging.log_to_file = true;
    }
    if (args.console) config.logging.log_to_console = true;

    // ── Initialize Logging ───────────────────
    LogPipeline pipeline(PipelineOptions{
        .queue_capacity = config.logging.queue_capacity,
        .drain_timeout = std::chrono::milliseconds(config.logging.drain_timeout_ms)});

    if (config.logging.log_to_file) {
        try {
            pipeline.register_sink(std::make_unique<RotatingFileSink>(
                config.logging.log_dir, "async_executor",
                config.logging.max_file_size_mb, config.logging.rotate_count));
        } catch (const std::exception& e) {
            std::cerr << "Cannot open log directory: " << e.what() << std::endl;
            config.logging.log_to_console = true;
        }
    }
    if (config.logging.log_to_console) {
        pipeline.register_sink(std::make_unique<ConsoleSink>());
    }

    auto level = parse_log_level(config.logging.level).value_or(LogLevel::Info);
    Logger logger(&pipeline, "main", level);
    logger.info("AsyncExecutor starting...");
    logger.info("Workers: " + std::to_string(config.executor.max_workers)
                + ", janitor: " + (config.janitor.enabled
                    ? std::to_string(config.janitor.interval_ms) + "ms" : std::string("off")));

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Run ──────────────────────────────────
    {
        Executor executor(config.executor, pipeline, config.janitor, level);

        run_workload(executor, args.tasks, logger);

        if (!executor.wait_for_completion(std::chrono::seconds(30))) {
            logger.warn("Workload did not finish within 30s");
        }

        auto info = executor.pool_info();
        logger.info("Pool: " + std::to_string(info.submitted_total) + " submitted, "
                    + std::to_string(info.completed_total) + " completed, "
                    + std::to_string(info.failed_total) + " failed, "
                    + std::to_string(info.cancelled_total) + " cancelled");

        auto stats = pipeline.stats();
        logger.info("Log pipeline: " + std::to_string(stats.delivered) + " delivered, "
                    + std::to_string(stats.dropped) + " dropped ("
                    + std::string(to_string(stats.health)) + ")");

        // ── Graceful Shutdown ────────────────
        logger.info("Shutting down...");
        executor.shutdown();
    }

    std::cout << "AsyncExecutor stopped." << std::endl;
    return 0;
}
