/**
 * @file scheduling_engine.cpp
 * @brief SchedulingEngine implementation.
 *
 * Completion and cancellation share unlink_locked(): every dependent loses
 * the edge (and is armed if that was its last one), every dependency loses
 * the back reference, then the record is deleted. Fires and completions
 * carry the admission id they were created for, so a record that was
 * cancelled and re-admitted under the same name is never touched by events
 * belonging to its predecessor.
 */

#include "scheduler/scheduling_engine.hpp"

#include <algorithm>
#include <exception>
#include <unordered_set>

namespace task_orchestrator {

SchedulingEngine::SchedulingEngine(Collaborators deps)
    : clock_(deps.clock)
    , timers_(deps.timers)
    , workers_(deps.workers)
    , executor_(deps.executor)
    , outputs_(deps.outputs)
    , logger_(deps.logger)
    , events_(deps.events) {}

// ─────────────────────────────────────────────
// Admission
// ─────────────────────────────────────────────

Result<int64_t> SchedulingEngine::schedule(ScheduleRequest request) {
    if (request.name.empty()) {
        Error error{ErrorCode::InvalidArgument, "Task name must not be empty"};
        reject(request.name, error);
        return error;
    }

    TaskRecord admitted;
    int64_t wait_ms = 0;
    std::vector<ArmedNote> armed;
    Result<void> outcome;
    {
        std::lock_guard lock(mutex_);
        outcome = admit_locked(request, admitted, wait_ms, armed);
    }

    if (!outcome) {
        reject(request.name, outcome.error());
        return outcome.error();
    }

    logger_.info("Scheduled " + request.program_path + " at "
                 + std::to_string(admitted.scheduled_time) + " (wait "
                 + std::to_string(wait_ms) + "ms, "
                 + std::to_string(admitted.depends_on.size()) + " dependencies)",
                 admitted.name);
    events_.record_admitted(admitted, wait_ms);
    report_armed(armed);
    return wait_ms;
}

Result<void> SchedulingEngine::admit_locked(const ScheduleRequest& request,
                                            TaskRecord& admitted,
                                            int64_t& wait_ms,
                                            std::vector<ArmedNote>& armed) {
    if (graph_.contains(request.name)) {
        return Error{ErrorCode::DuplicateTask, "Task already exists: " + request.name};
    }

    const EpochMillis now = clock_.now_ms();
    const EpochMillis when = request.scheduled_time.value_or(now);

    // Unknown dependencies already finished or never existed.
    std::unordered_set<TaskName> depends_on;
    for (const auto& dep : request.depends_on) {
        if (graph_.contains(dep)) {
            depends_on.insert(dep);
        }
    }

    for (const auto& dep : depends_on) {
        const auto* parent = graph_.find(dep);
        if (parent->scheduled_time > when) {
            return Error{ErrorCode::OrderingViolation,
                         "Task " + request.name + " at " + std::to_string(when)
                         + " would run before its dependency " + dep + " at "
                         + std::to_string(parent->scheduled_time)};
        }
    }

    TaskRecord record;
    record.name = request.name;
    record.program_path = request.program_path;
    record.parameters = request.parameters;
    record.scheduled_time = when;
    record.state = TaskState::Pending;
    record.admission_id = next_admission_id_++;
    record.output_sink = outputs_.allocate(record.name, record.admission_id);

    if (auto inserted = graph_.insert(std::move(record)); !inserted) {
        return inserted.error();
    }
    for (const auto& dep : depends_on) {
        graph_.add_dependency(request.name, dep);
        graph_.add_dependent(dep, request.name);
    }

    auto* stored = graph_.find(request.name);
    if (stored->depends_on.empty()) {
        armed.push_back(arm_locked(*stored));
    }

    wait_ms = millis_until(when, now);
    admitted = *stored;
    return Result<void>{};
}

SchedulingEngine::ArmedNote SchedulingEngine::arm_locked(TaskRecord& record) {
    auto delay = Milliseconds{millis_until(record.scheduled_time, clock_.now_ms())};
    record.state = TaskState::Armed;
    auto timer = timers_.arm(delay, [this, name = record.name, id = record.admission_id] {
        on_timer_fired(name, id);
    });
    armed_timers_[record.name] = timer;
    return ArmedNote{record.name, delay};
}

// ─────────────────────────────────────────────
// Cancellation
// ─────────────────────────────────────────────

Result<TaskRecord> SchedulingEngine::cancel(const TaskName& name) {
    TaskState prior_state = TaskState::Pending;
    bool timer_already_fired = false;
    std::vector<ArmedNote> armed;
    std::optional<Result<TaskRecord>> removed;
    {
        std::lock_guard lock(mutex_);
        const auto* record = graph_.find(name);
        if (!record) {
            removed.emplace(Error{ErrorCode::UnknownTask, "No such task: " + name});
        } else {
            prior_state = record->state;

            // Disarm before touching the graph so the timer cannot fire mid-cancel.
            if (auto it = armed_timers_.find(name); it != armed_timers_.end()) {
                timer_already_fired = !timers_.disarm(it->second);
                armed_timers_.erase(it);
            }
            removed.emplace(unlink_locked(name, armed));
        }
    }

    if (!*removed) {
        logger_.debug("Cancel rejected: " + removed->error().message, name);
        return removed->error();
    }

    TaskRecord record = std::move(**removed);
    record.state = TaskState::Cancelled;

    if (prior_state == TaskState::Running) {
        logger_.warn("Cancelled while running; the program is left to finish", name);
    } else if (timer_already_fired) {
        logger_.info("Cancelled after its timer fired; dispatch will be skipped", name);
    } else {
        logger_.info("Cancelled (was " + std::string(to_string(prior_state)) + ", "
                     + std::to_string(record.dependents.size()) + " dependents freed)", name);
    }
    events_.record_cancelled(record, prior_state);
    report_armed(armed);
    drained_cv_.notify_all();
    return record;
}

Result<TaskRecord> SchedulingEngine::unlink_locked(const TaskName& name,
                                                   std::vector<ArmedNote>& armed) {
    const auto* record = graph_.find(name);
    if (!record) {
        return Error{ErrorCode::UnknownTask, "No such task: " + name};
    }

    const auto dependents = record->dependents;
    const auto depends_on = record->depends_on;

    for (const auto& child_name : dependents) {
        graph_.remove_dependency(child_name, name);
        auto* child = graph_.find(child_name);
        if (child && child->depends_on.empty() && child->state == TaskState::Pending) {
            armed.push_back(arm_locked(*child));
        }
    }
    for (const auto& parent : depends_on) {
        graph_.remove_dependent(parent, name);
    }

    return graph_.remove(name);
}

// ─────────────────────────────────────────────
// Dispatch & Completion
// ─────────────────────────────────────────────

void SchedulingEngine::on_timer_fired(const TaskName& name, AdmissionId admission_id) {
    ExecutionRequest request;
    {
        std::lock_guard lock(mutex_);
        auto* record = graph_.find(name);
        if (!record || record->admission_id != admission_id
            || record->state != TaskState::Armed) {
            return;
        }
        record->state = TaskState::Running;
        armed_timers_.erase(name);

        request.name = record->name;
        request.program_path = record->program_path;
        request.parameters = record->parameters;
        request.output_sink = record->output_sink;
    }

    if (!workers_.post([this, request, admission_id] { dispatch(request, admission_id); })) {
        logger_.warn("Worker pool stopped; task not dispatched", name);
    }
}

void SchedulingEngine::dispatch(const ExecutionRequest& request, AdmissionId admission_id) {
    bool live = false;
    {
        std::lock_guard lock(mutex_);
        const auto* record = graph_.find(request.name);
        live = record && record->admission_id == admission_id;
    }
    if (!live) {
        logger_.debug("Cancelled before launch", request.name);
        return;
    }

    logger_.info("Dispatching " + request.program_path, request.name);
    events_.record_dispatched(request.name);

    ExecutionResult result;
    try {
        result = executor_.run(request);
    } catch (const std::exception& e) {
        result = ExecutionResult{};
        result.error_message = std::string("Executor failed: ") + e.what();
    }
    result.name = request.name;

    if (result.error_message) {
        logger_.warn(*result.error_message, request.name);
    } else if (result.term_signal) {
        logger_.warn("Program killed by signal " + std::to_string(*result.term_signal),
                     request.name);
    } else if (!result.succeeded()) {
        logger_.warn("Program exited with status " + std::to_string(result.exit_code.value_or(-1)),
                     request.name);
    } else {
        logger_.info("Program finished in " + std::to_string(result.duration.count()) + "ms",
                     request.name);
    }
    events_.record_finished(result);

    complete(request.name, admission_id);
}

void SchedulingEngine::complete(const TaskName& name, AdmissionId admission_id) {
    std::vector<ArmedNote> armed;
    std::optional<TaskRecord> removed;
    {
        std::lock_guard lock(mutex_);
        const auto* record = graph_.find(name);
        if (record && record->admission_id == admission_id) {
            if (auto unlinked = unlink_locked(name, armed)) {
                removed = std::move(*unlinked);
            }
        }
    }

    if (!removed) {
        logger_.debug("Completion ignored; task was cancelled while running", name);
        return;
    }
    removed->state = TaskState::Done;
    logger_.debug("Removed as " + std::string(to_string(removed->state)) + ", "
                  + std::to_string(removed->dependents.size()) + " dependents freed", name);
    report_armed(armed);
    drained_cv_.notify_all();
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

std::optional<TaskRecord> SchedulingEngine::find(const TaskName& name) const {
    std::lock_guard lock(mutex_);
    return graph_.get(name);
}

std::vector<TaskRecord> SchedulingEngine::snapshot() const {
    std::lock_guard lock(mutex_);
    return graph_.snapshot();
}

size_t SchedulingEngine::size() const {
    std::lock_guard lock(mutex_);
    return graph_.size();
}

bool SchedulingEngine::is_consistent() const {
    std::lock_guard lock(mutex_);
    if (!graph_.is_consistent()) return false;
    // Armed ⇔ no unmet dependencies and a live timer.
    for (const auto& record : graph_.snapshot()) {
        bool has_timer = armed_timers_.contains(record.name);
        if ((record.state == TaskState::Armed) != has_timer) return false;
        if (record.state == TaskState::Pending && record.depends_on.empty()) return false;
        if (record.state != TaskState::Pending && !record.depends_on.empty()) return false;
    }
    return true;
}

std::optional<TimerId> SchedulingEngine::timer_of(const TaskName& name) const {
    std::lock_guard lock(mutex_);
    auto it = armed_timers_.find(name);
    if (it == armed_timers_.end()) return std::nullopt;
    return it->second;
}

bool SchedulingEngine::wait_until_empty(Milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return drained_cv_.wait_for(lock, timeout, [this] { return graph_.empty(); });
}

// ─────────────────────────────────────────────
// Reporting (outside the lock)
// ─────────────────────────────────────────────

void SchedulingEngine::report_armed(const std::vector<ArmedNote>& armed) {
    for (const auto& note : armed) {
        logger_.debug("Armed, fires in " + std::to_string(note.delay.count()) + "ms", note.name);
        events_.record_armed(note.name, note.delay);
    }
}

void SchedulingEngine::reject(const TaskName& name, const Error& error) {
    logger_.warn("Schedule rejected (" + std::string(to_string(error.code)) + "): "
                 + error.message, name);
    events_.record_rejected(name, error);
}

}  // namespace task_orchestrator
