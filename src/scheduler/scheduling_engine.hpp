/**
 * @file scheduling_engine.hpp
 * @brief Admission, time-deferred dispatch and cancellation over the task graph.
 *
 * All graph reads and writes happen under one store-wide mutex. Timers are
 * armed and disarmed under that mutex; external programs run on the worker
 * pool without it. Log lines and lifecycle events are emitted after the
 * mutex is released.
 *
 * Lock order: engine mutex → timer service mutex. Timer callbacks are
 * invoked with no timer lock held and may take the engine mutex.
 */

#pragma once

#include "core/clock.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/executor.hpp"
#include "executor/timer_service.hpp"
#include "executor/worker_pool.hpp"
#include "graph/task_graph.hpp"
#include "output/output_provisioner.hpp"
#include "telemetry/event_recorder.hpp"

#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace task_orchestrator {

/**
 * @brief Arguments of schedule().
 */
struct ScheduleRequest {
    TaskName name;
    std::string program_path;
    std::optional<EpochMillis> scheduled_time;   ///< Defaults to now
    std::vector<TaskName> depends_on;            ///< Unknown names are dropped
    std::vector<std::string> parameters;
};

class SchedulingEngine {
public:
    struct Collaborators {
        IClock& clock;
        ITimerService& timers;
        WorkerPool& workers;
        ITaskExecutor& executor;
        IOutputProvisioner& outputs;
        Logger& logger;
        EventRecorder& events;
    };

    explicit SchedulingEngine(Collaborators deps);

    SchedulingEngine(const SchedulingEngine&) = delete;
    SchedulingEngine& operator=(const SchedulingEngine&) = delete;

    /**
     * @brief Admit a task.
     *
     * @return Advisory wait in ms until intended dispatch (0 if already due).
     *         Fails with InvalidArgument (empty name), DuplicateTask or
     *         OrderingViolation; on failure the graph is unchanged.
     */
    Result<int64_t> schedule(ScheduleRequest request);

    /**
     * @brief Remove a task, freeing its dependents.
     *
     * @return The removed record, `state == Cancelled`, with the edge sets it
     *         had at the moment of removal. Fails with UnknownTask.
     */
    Result<TaskRecord> cancel(const TaskName& name);

    // ── Queries ───────────────────────────────
    [[nodiscard]] std::optional<TaskRecord> find(const TaskName& name) const;
    [[nodiscard]] std::vector<TaskRecord> snapshot() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool is_consistent() const;

    /// Timer currently armed for a task, if any.
    [[nodiscard]] std::optional<TimerId> timer_of(const TaskName& name) const;

    /// Block until the store is empty or the timeout elapses.
    bool wait_until_empty(Milliseconds timeout);

private:
    struct ArmedNote {
        TaskName name;
        Milliseconds delay;
    };

    Result<void> admit_locked(const ScheduleRequest& request, TaskRecord& admitted,
                              int64_t& wait_ms, std::vector<ArmedNote>& armed);
    ArmedNote arm_locked(TaskRecord& record);
    Result<TaskRecord> unlink_locked(const TaskName& name, std::vector<ArmedNote>& armed);

    void on_timer_fired(const TaskName& name, AdmissionId admission_id);
    void dispatch(const ExecutionRequest& request, AdmissionId admission_id);
    void complete(const TaskName& name, AdmissionId admission_id);

    void report_armed(const std::vector<ArmedNote>& armed);
    void reject(const TaskName& name, const Error& error);

    IClock& clock_;
    ITimerService& timers_;
    WorkerPool& workers_;
    ITaskExecutor& executor_;
    IOutputProvisioner& outputs_;
    Logger& logger_;
    EventRecorder& events_;

    mutable std::mutex mutex_;
    std::condition_variable drained_cv_;
    TaskGraph graph_;
    std::unordered_map<TaskName, TimerId> armed_timers_;
    AdmissionId next_admission_id_ = 1;
};

}  // namespace task_orchestrator
