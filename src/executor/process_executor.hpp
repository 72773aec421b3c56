/**
 * @file process_executor.hpp
 * @brief Executor hook that launches tasks as child processes.
 */

#pragma once

#include "executor/executor.hpp"

#include <string>
#include <vector>

namespace task_orchestrator {

/**
 * @brief Runs a task with posix_spawnp and waits for it.
 *
 * argv is `[interpreter, program_path, parameters...]` when an interpreter
 * is configured, `[program_path, parameters...]` otherwise. stdout and
 * stderr are both appended to the task's output sink; stdin is /dev/null.
 */
class ProcessExecutor : public ITaskExecutor {
public:
    explicit ProcessExecutor(std::string interpreter = {});

    ExecutionResult run(const ExecutionRequest& request) override;

    [[nodiscard]] std::vector<std::string> build_argv(const ExecutionRequest& request) const;
    [[nodiscard]] const std::string& interpreter() const noexcept { return interpreter_; }

private:
    std::string interpreter_;
};

}  // namespace task_orchestrator
