/**
 * @file orchestrator.hpp
 * @brief Top-level Orchestrator facade tying the modules together.
 *
 * Owns the logger, event recorder, clock, output provisioner, executor,
 * timer service, worker pool and scheduling engine, and exposes the
 * caller-facing operations:
 *   1. schedule() a task with optional time, dependencies and parameters
 *   2. cancel() a task, freeing its dependents
 *   3. inspect the live graph (find / snapshot / size / wait_until_empty)
 *
 * Every collaborator can be injected through Options; anything left null is
 * built from the Config (SystemClock, ThreadTimerService, ProcessExecutor,
 * DirectoryOutputProvisioner, JSON sinks).
 */

#pragma once

#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/executor.hpp"
#include "executor/timer_service.hpp"
#include "executor/worker_pool.hpp"
#include "graph/task_graph.hpp"
#include "output/output_provisioner.hpp"
#include "scheduler/scheduling_engine.hpp"
#include "telemetry/event_recorder.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <vector>

namespace task_orchestrator {

class Orchestrator {
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;
        std::unique_ptr<ILogSink> event_sink;
        std::unique_ptr<IClock> clock;
        std::unique_ptr<ITimerService> timers;
        std::unique_ptr<ITaskExecutor> executor;
        std::unique_ptr<IOutputProvisioner> outputs;
    };

    /**
     * @brief Build an orchestrator.
     *
     * Fails with ErrorCode::InvalidConfiguration when no provisioner is
     * injected and the configured output directory is unusable.
     */
    static Result<std::unique_ptr<Orchestrator>> create(Options opts);

    /// Reachable only through create().
    Orchestrator(Passkey,
                 Config config,
                 std::unique_ptr<Logger> logger,
                 std::unique_ptr<EventRecorder> events,
                 std::unique_ptr<IClock> clock,
                 std::unique_ptr<IOutputProvisioner> outputs,
                 std::unique_ptr<ITaskExecutor> executor,
                 std::unique_ptr<ITimerService> timers);
    ~Orchestrator();

    // Non-copyable, non-movable
    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // ── Operations ───────────────────────────
    Result<int64_t> schedule(ScheduleRequest request);
    Result<TaskRecord> cancel(const TaskName& name);

    // ── Queries ──────────────────────────────
    [[nodiscard]] std::optional<TaskRecord> find(const TaskName& name) const;
    [[nodiscard]] std::vector<TaskRecord> snapshot() const;
    [[nodiscard]] size_t size() const;
    bool wait_until_empty(Milliseconds timeout);

    /**
     * @brief Stop firing timers and join the workers.
     *
     * Pending and armed tasks stay in the store but never run; programs
     * already running are waited for. Idempotent; also run by the destructor.
     */
    void shutdown();

    // ── Accessors ────────────────────────────
    [[nodiscard]] const Config& config() const noexcept { return config_; }
    Logger& logger() noexcept { return *logger_; }
    EventRecorder& events() noexcept { return *events_; }
    SchedulingEngine& engine() noexcept { return *engine_; }
    IClock& clock() noexcept { return *clock_; }

private:
    Config config_;
    std::unique_ptr<Logger> logger_;
    std::unique_ptr<EventRecorder> events_;
    std::unique_ptr<IClock> clock_;
    std::unique_ptr<IOutputProvisioner> outputs_;
    std::unique_ptr<ITaskExecutor> executor_;
    std::unique_ptr<ITimerService> timers_;
    std::unique_ptr<WorkerPool> workers_;
    std::unique_ptr<SchedulingEngine> engine_;
    std::atomic<bool> shut_down_{false};
};

/**
 * @brief Build the log sink the telemetry config asks for.
 *
 * JsonFileSink under `log_dir` with the given prefix, or stdout when
 * `log_dir` is empty.
 */
std::unique_ptr<ILogSink> make_sink(const TelemetryConfig& telemetry, const std::string& prefix);

}  // namespace task_orchestrator
