/**
 * @file event_recorder.hpp
 * @brief Structured task lifecycle events as NDJSON.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/executor.hpp"
#include "graph/task_graph.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

namespace task_orchestrator {

/**
 * @brief Emits one NDJSON event per lifecycle transition and keeps counters.
 */
class EventRecorder {
public:
    struct Counters {
        uint64_t admitted = 0;
        uint64_t rejected = 0;
        uint64_t armed = 0;
        uint64_t dispatched = 0;
        uint64_t finished = 0;
        uint64_t failed = 0;       ///< Finished with non-zero exit, signal or launch error
        uint64_t cancelled = 0;
    };

    explicit EventRecorder(std::unique_ptr<ILogSink> sink);

    void record_admitted(const TaskRecord& record, int64_t wait_ms);
    void record_rejected(const TaskName& name, const Error& error);
    void record_armed(const TaskName& name, Milliseconds delay);
    void record_dispatched(const TaskName& name);
    void record_finished(const ExecutionResult& result);
    void record_cancelled(const TaskRecord& record, TaskState prior_state);

    [[nodiscard]] Counters counters() const noexcept;

    void flush();

private:
    void emit(std::string_view json_line);

    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    std::atomic<uint64_t> admitted_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> armed_{0};
    std::atomic<uint64_t> dispatched_{0};
    std::atomic<uint64_t> finished_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> cancelled_{0};
};

}  // namespace task_orchestrator
