/**
 * @file task_graph.hpp
 * @brief Name-indexed store of live tasks and their dependency edges.
 *
 * Edges are stored redundantly on both endpoints (depends_on / dependents)
 * so every mutation and cascade lookup is a direct key access. The store is
 * not synchronized: SchedulingEngine owns it and calls it only while holding
 * its store-wide lock.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace task_orchestrator {

/**
 * @brief A single task in the store.
 *
 * `dependents` is a reverse-lookup index only; the store's map is the sole
 * owner of records.
 */
struct TaskRecord {
    TaskName name;
    std::string program_path;
    std::vector<std::string> parameters;
    EpochMillis scheduled_time = 0;
    std::unordered_set<TaskName> depends_on;
    std::unordered_set<TaskName> dependents;
    OutputSink output_sink;
    TaskState state = TaskState::Pending;
    AdmissionId admission_id = 0;

    bool operator==(const TaskRecord&) const = default;
};

/**
 * @brief Dependency graph store.
 */
class TaskGraph {
public:
    TaskGraph() = default;

    // ── Records ───────────────────────────────
    Result<void> insert(TaskRecord record);
    Result<TaskRecord> remove(const TaskName& name);

    [[nodiscard]] TaskRecord* find(const TaskName& name);
    [[nodiscard]] const TaskRecord* find(const TaskName& name) const;
    [[nodiscard]] std::optional<TaskRecord> get(const TaskName& name) const;
    [[nodiscard]] bool contains(const TaskName& name) const;

    // ── Edges ─────────────────────────────────
    // Each call touches one side only; callers keep both sides in step.
    bool add_dependent(const TaskName& task, const TaskName& dependent);
    bool remove_dependent(const TaskName& task, const TaskName& dependent);
    bool add_dependency(const TaskName& task, const TaskName& dependency);
    bool remove_dependency(const TaskName& task, const TaskName& dependency);

    // ── Queries ───────────────────────────────
    [[nodiscard]] size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] std::vector<TaskName> names() const;
    [[nodiscard]] std::vector<TaskRecord> snapshot() const;

    /**
     * @brief Check the mirror and no-dangling-edge invariants.
     *
     * True when for all A, B: B ∈ A.dependents ⇔ A ∈ B.depends_on, and
     * every edge endpoint is present in the store. O(V+E).
     */
    [[nodiscard]] bool is_consistent() const;

    bool operator==(const TaskGraph&) const = default;

private:
    std::unordered_map<TaskName, TaskRecord> tasks_;
};

}  // namespace task_orchestrator
