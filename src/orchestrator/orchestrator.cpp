/**
 * @file orchestrator.cpp
 * @brief Orchestrator wiring and lifecycle.
 */

#include "orchestrator/orchestrator.hpp"

#include "executor/process_executor.hpp"
#include "telemetry/json_sink.hpp"

#include <memory>

namespace task_orchestrator {

std::unique_ptr<ILogSink> make_sink(const TelemetryConfig& telemetry, const std::string& prefix) {
    if (telemetry.log_dir.empty()) {
        return std::make_unique<StdoutSink>();
    }
    return std::make_unique<JsonFileSink>(telemetry.log_dir, prefix,
                                          telemetry.max_file_size_mb,
                                          telemetry.rotate_count);
}

Result<std::unique_ptr<Orchestrator>> Orchestrator::create(Options opts) {
    if (!opts.outputs) {
        auto provisioner = DirectoryOutputProvisioner::create(opts.config.output);
        if (!provisioner) return provisioner.error();
        opts.outputs = std::move(*provisioner);
    }

    if (!opts.log_sink) {
        opts.log_sink = make_sink(opts.config.telemetry, "task_orchestrator");
    }
    if (!opts.event_sink) {
        if (opts.config.telemetry.events) {
            opts.event_sink = make_sink(opts.config.telemetry, "task_events");
        } else {
            opts.event_sink = std::make_unique<NullSink>();
        }
    }
    if (!opts.clock) {
        opts.clock = std::make_unique<SystemClock>();
    }
    if (!opts.timers) {
        opts.timers = std::make_unique<ThreadTimerService>();
    }
    if (!opts.executor) {
        opts.executor = std::make_unique<ProcessExecutor>(opts.config.executor.interpreter);
    }

    auto logger = std::make_unique<Logger>(std::move(opts.log_sink),
                                           opts.config.telemetry.log_level);
    auto events = std::make_unique<EventRecorder>(std::move(opts.event_sink));

    return std::make_unique<Orchestrator>(
        Passkey{}, std::move(opts.config), std::move(logger), std::move(events),
        std::move(opts.clock), std::move(opts.outputs),
        std::move(opts.executor), std::move(opts.timers));
}

Orchestrator::Orchestrator(Passkey,
                           Config config,
                           std::unique_ptr<Logger> logger,
                           std::unique_ptr<EventRecorder> events,
                           std::unique_ptr<IClock> clock,
                           std::unique_ptr<IOutputProvisioner> outputs,
                           std::unique_ptr<ITaskExecutor> executor,
                           std::unique_ptr<ITimerService> timers)
    : config_(std::move(config))
    , logger_(std::move(logger))
    , events_(std::move(events))
    , clock_(std::move(clock))
    , outputs_(std::move(outputs))
    , executor_(std::move(executor))
    , timers_(std::move(timers))
    , workers_(std::make_unique<WorkerPool>(config_.executor.workers))
    , engine_(std::make_unique<SchedulingEngine>(SchedulingEngine::Collaborators{
          .clock = *clock_,
          .timers = *timers_,
          .workers = *workers_,
          .executor = *executor_,
          .outputs = *outputs_,
          .logger = *logger_,
          .events = *events_})) {
    logger_->info("Orchestrator started: " + std::to_string(workers_->thread_count())
                  + " workers, output dir " + config_.output.dir.string());
}

Orchestrator::~Orchestrator() {
    shutdown();
}

void Orchestrator::shutdown() {
    if (shut_down_.exchange(true)) return;

    logger_->info("Orchestrator shutting down ("
                  + std::to_string(engine_->size()) + " tasks still scheduled)");
    // Timers first so nothing new reaches the pool; the pool then lets
    // running programs finish while the engine is still alive.
    timers_->shutdown();
    workers_->shutdown();
    logger_->info("Orchestrator stopped");
    logger_->flush();
    events_->flush();
}

Result<int64_t> Orchestrator::schedule(ScheduleRequest request) {
    return engine_->schedule(std::move(request));
}

Result<TaskRecord> Orchestrator::cancel(const TaskName& name) {
    return engine_->cancel(name);
}

std::optional<TaskRecord> Orchestrator::find(const TaskName& name) const {
    return engine_->find(name);
}

std::vector<TaskRecord> Orchestrator::snapshot() const {
    return engine_->snapshot();
}

size_t Orchestrator::size() const {
    return engine_->size();
}

bool Orchestrator::wait_until_empty(Milliseconds timeout) {
    return engine_->wait_until_empty(timeout);
}

}  // namespace task_orchestrator
