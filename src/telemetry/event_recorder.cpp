/**
 * @file event_recorder.cpp
 * @brief EventRecorder implementation.
 */

#include "telemetry/event_recorder.hpp"

#include <sstream>

namespace task_orchestrator {

EventRecorder::EventRecorder(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void EventRecorder::record_admitted(const TaskRecord& record, int64_t wait_ms) {
    admitted_.fetch_add(1, std::memory_order_relaxed);

    std::ostringstream oss;
    oss << R"({"event":"admitted")"
        << R"(,"task":")" << json_escape(record.name) << "\""
        << R"(,"admission_id":)" << record.admission_id
        << R"(,"scheduled_ms":)" << record.scheduled_time
        << R"(,"wait_ms":)" << wait_ms
        << R"(,"depends_on":)" << record.depends_on.size()
        << R"(,"state":")" << to_string(record.state) << "\""
        << "}";
    emit(oss.str());
}

void EventRecorder::record_rejected(const TaskName& name, const Error& error) {
    rejected_.fetch_add(1, std::memory_order_relaxed);

    std::ostringstream oss;
    oss << R"({"event":"rejected")"
        << R"(,"task":")" << json_escape(name) << "\""
        << R"(,"code":")" << to_string(error.code) << "\""
        << R"(,"reason":")" << json_escape(error.message) << "\""
        << "}";
    emit(oss.str());
}

void EventRecorder::record_armed(const TaskName& name, Milliseconds delay) {
    armed_.fetch_add(1, std::memory_order_relaxed);

    std::ostringstream oss;
    oss << R"({"event":"armed")"
        << R"(,"task":")" << json_escape(name) << "\""
        << R"(,"delay_ms":)" << delay.count()
        << "}";
    emit(oss.str());
}

void EventRecorder::record_dispatched(const TaskName& name) {
    dispatched_.fetch_add(1, std::memory_order_relaxed);

    std::ostringstream oss;
    oss << R"({"event":"dispatched")"
        << R"(,"task":")" << json_escape(name) << "\""
        << "}";
    emit(oss.str());
}

void EventRecorder::record_finished(const ExecutionResult& result) {
    finished_.fetch_add(1, std::memory_order_relaxed);
    if (!result.succeeded()) {
        failed_.fetch_add(1, std::memory_order_relaxed);
    }

    std::ostringstream oss;
    oss << R"({"event":"finished")"
        << R"(,"task":")" << json_escape(result.name) << "\""
        << R"(,"duration_ms":)" << result.duration.count();
    if (result.exit_code) oss << R"(,"exit_code":)" << *result.exit_code;
    if (result.term_signal) oss << R"(,"signal":)" << *result.term_signal;
    if (result.error_message) {
        oss << R"(,"error":")" << json_escape(*result.error_message) << "\"";
    }
    oss << "}";
    emit(oss.str());
}

void EventRecorder::record_cancelled(const TaskRecord& record, TaskState prior_state) {
    cancelled_.fetch_add(1, std::memory_order_relaxed);

    std::ostringstream oss;
    oss << R"({"event":"cancelled")"
        << R"(,"task":")" << json_escape(record.name) << "\""
        << R"(,"prior_state":")" << to_string(prior_state) << "\""
        << R"(,"freed_dependents":)" << record.dependents.size()
        << "}";
    emit(oss.str());
}

EventRecorder::Counters EventRecorder::counters() const noexcept {
    return Counters{
        .admitted = admitted_.load(std::memory_order_relaxed),
        .rejected = rejected_.load(std::memory_order_relaxed),
        .armed = armed_.load(std::memory_order_relaxed),
        .dispatched = dispatched_.load(std::memory_order_relaxed),
        .finished = finished_.load(std::memory_order_relaxed),
        .failed = failed_.load(std::memory_order_relaxed),
        .cancelled = cancelled_.load(std::memory_order_relaxed)
    };
}

void EventRecorder::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void EventRecorder::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace task_orchestrator
