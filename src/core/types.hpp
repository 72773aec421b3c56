/**
 * @file types.hpp
 * @brief Fundamental types used throughout TaskOrchestrator.
 *
 * Defines TaskName, EpochMillis, TaskState and the other shared vocabulary
 * types. All types are value types.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace task_orchestrator {

// ─────────────────────────────────────────────
// Identity & Time Types
// ─────────────────────────────────────────────

using TaskName = std::string;
using AdmissionId = uint64_t;
using TimerId = uint64_t;

/// Milliseconds since the Unix epoch.
using EpochMillis = int64_t;
using Milliseconds = std::chrono::milliseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Task State
// ─────────────────────────────────────────────

enum class TaskState : uint8_t {
    Pending,       ///< Waiting for dependencies
    Armed,         ///< No unmet dependencies, timer set
    Running,       ///< Timer fired, handed to the executor
    Done,          ///< Program exited, record removed
    Cancelled      ///< Removed by cancel()
};

/**
 * @brief Convert TaskState to string representation.
 */
[[nodiscard]] constexpr std::string_view to_string(TaskState state) noexcept {
    switch (state) {
        case TaskState::Pending:   return "pending";
        case TaskState::Armed:     return "armed";
        case TaskState::Running:   return "running";
        case TaskState::Done:      return "done";
        case TaskState::Cancelled: return "cancelled";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Output Sink
// ─────────────────────────────────────────────

/**
 * @brief Write destination for a task's combined stdout/stderr.
 *
 * Allocated by an IOutputProvisioner at admission. The executor creates
 * the file on dispatch and appends to it.
 */
struct OutputSink {
    std::string path;

    bool operator==(const OutputSink&) const = default;
};

}  // namespace task_orchestrator
