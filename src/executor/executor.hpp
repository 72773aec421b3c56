/**
 * @file executor.hpp
 * @brief Executor hook contract: run a task's program and report how it ended.
 */

#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace task_orchestrator {

struct ExecutionRequest {
    TaskName name;
    std::string program_path;
    std::vector<std::string> parameters;
    OutputSink output_sink;
};

struct ExecutionResult {
    TaskName name;
    std::optional<int> exit_code;           ///< Set when the program exited normally
    std::optional<int> term_signal;         ///< Set when the program was killed by a signal
    Milliseconds duration{0};
    std::optional<std::string> error_message;  ///< Set when the program could not be launched

    [[nodiscard]] bool succeeded() const noexcept {
        return exit_code.has_value() && *exit_code == 0;
    }
};

/**
 * @brief Runs one task's external program.
 *
 * run() blocks until the program exits. Its outcome is informational only:
 * the engine completes the task whatever the result.
 */
class ITaskExecutor {
public:
    virtual ~ITaskExecutor() = default;

    virtual ExecutionResult run(const ExecutionRequest& request) = 0;
};

}  // namespace task_orchestrator
