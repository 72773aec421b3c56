/**
 * @file task_graph.cpp
 * @brief TaskGraph implementation.
 */

#include "graph/task_graph.hpp"

#include <algorithm>

namespace task_orchestrator {

// ─────────────────────────────────────────────
// Records
// ─────────────────────────────────────────────

Result<void> TaskGraph::insert(TaskRecord record) {
    if (tasks_.contains(record.name)) {
        return Error{ErrorCode::DuplicateTask, "Task already exists: " + record.name};
    }
    auto name = record.name;
    tasks_.emplace(std::move(name), std::move(record));
    return Result<void>{};
}

Result<TaskRecord> TaskGraph::remove(const TaskName& name) {
    auto it = tasks_.find(name);
    if (it == tasks_.end()) {
        return Error{ErrorCode::UnknownTask, "No such task: " + name};
    }
    TaskRecord record = std::move(it->second);
    tasks_.erase(it);
    return record;
}

TaskRecord* TaskGraph::find(const TaskName& name) {
    auto it = tasks_.find(name);
    return it == tasks_.end() ? nullptr : &it->second;
}

const TaskRecord* TaskGraph::find(const TaskName& name) const {
    auto it = tasks_.find(name);
    return it == tasks_.end() ? nullptr : &it->second;
}

std::optional<TaskRecord> TaskGraph::get(const TaskName& name) const {
    if (const auto* record = find(name)) return *record;
    return std::nullopt;
}

bool TaskGraph::contains(const TaskName& name) const {
    return tasks_.contains(name);
}

// ─────────────────────────────────────────────
// Edges
// ─────────────────────────────────────────────

bool TaskGraph::add_dependent(const TaskName& task, const TaskName& dependent) {
    auto* record = find(task);
    if (!record) return false;
    return record->dependents.insert(dependent).second;
}

bool TaskGraph::remove_dependent(const TaskName& task, const TaskName& dependent) {
    auto* record = find(task);
    if (!record) return false;
    return record->dependents.erase(dependent) > 0;
}

bool TaskGraph::add_dependency(const TaskName& task, const TaskName& dependency) {
    auto* record = find(task);
    if (!record) return false;
    return record->depends_on.insert(dependency).second;
}

bool TaskGraph::remove_dependency(const TaskName& task, const TaskName& dependency) {
    auto* record = find(task);
    if (!record) return false;
    return record->depends_on.erase(dependency) > 0;
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

size_t TaskGraph::size() const noexcept {
    return tasks_.size();
}

bool TaskGraph::empty() const noexcept {
    return tasks_.empty();
}

std::vector<TaskName> TaskGraph::names() const {
    std::vector<TaskName> out;
    out.reserve(tasks_.size());
    for (const auto& [name, _] : tasks_) {
        out.push_back(name);
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<TaskRecord> TaskGraph::snapshot() const {
    std::vector<TaskRecord> out;
    out.reserve(tasks_.size());
    for (const auto& [_, record] : tasks_) {
        out.push_back(record);
    }
    std::sort(out.begin(), out.end(),
              [](const TaskRecord& a, const TaskRecord& b) { return a.name < b.name; });
    return out;
}

bool TaskGraph::is_consistent() const {
    for (const auto& [name, record] : tasks_) {
        for (const auto& dep : record.depends_on) {
            const auto* parent = find(dep);
            if (!parent || !parent->dependents.contains(name)) return false;
        }
        for (const auto& child_name : record.dependents) {
            const auto* child = find(child_name);
            if (!child || !child->depends_on.contains(name)) return false;
        }
    }
    return true;
}

}  // namespace task_orchestrator
