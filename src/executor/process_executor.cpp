/**
 * @file process_executor.cpp
 * @brief ProcessExecutor implementation on posix_spawn / waitpid.
 */

#include "executor/process_executor.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace task_orchestrator {

namespace {

/**
 * @brief Owns a posix_spawn_file_actions_t for the duration of one launch.
 */
class SpawnFileActions {
public:
    SpawnFileActions() { init_rc_ = ::posix_spawn_file_actions_init(&actions_); }
    ~SpawnFileActions() {
        if (init_rc_ == 0) ::posix_spawn_file_actions_destroy(&actions_);
    }

    SpawnFileActions(const SpawnFileActions&) = delete;
    SpawnFileActions& operator=(const SpawnFileActions&) = delete;

    [[nodiscard]] int init_status() const noexcept { return init_rc_; }
    posix_spawn_file_actions_t* get() noexcept { return &actions_; }

private:
    posix_spawn_file_actions_t actions_{};
    int init_rc_ = -1;
};

ExecutionResult launch_failure(const ExecutionRequest& request,
                               std::chrono::steady_clock::time_point start,
                               std::string message) {
    ExecutionResult result;
    result.name = request.name;
    result.duration = std::chrono::duration_cast<Milliseconds>(
        std::chrono::steady_clock::now() - start);
    result.error_message = std::move(message);
    return result;
}

}  // anonymous namespace

ProcessExecutor::ProcessExecutor(std::string interpreter)
    : interpreter_(std::move(interpreter)) {}

std::vector<std::string> ProcessExecutor::build_argv(const ExecutionRequest& request) const {
    std::vector<std::string> argv;
    argv.reserve(request.parameters.size() + 2);
    if (!interpreter_.empty()) {
        argv.push_back(interpreter_);
    }
    argv.push_back(request.program_path);
    argv.insert(argv.end(), request.parameters.begin(), request.parameters.end());
    return argv;
}

ExecutionResult ProcessExecutor::run(const ExecutionRequest& request) {
    auto start = std::chrono::steady_clock::now();

    int out_fd = ::open(request.output_sink.path.c_str(),
                        O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (out_fd < 0) {
        return launch_failure(request, start,
            "Cannot open output sink " + request.output_sink.path + ": "
            + std::string(strerror(errno)));
    }

    SpawnFileActions actions;
    if (actions.init_status() != 0) {
        ::close(out_fd);
        return launch_failure(request, start,
            "posix_spawn_file_actions_init failed: "
            + std::string(strerror(actions.init_status())));
    }

    int rc = ::posix_spawn_file_actions_addopen(actions.get(), STDIN_FILENO,
                                                "/dev/null", O_RDONLY, 0);
    if (rc == 0) rc = ::posix_spawn_file_actions_adddup2(actions.get(), out_fd, STDOUT_FILENO);
    if (rc == 0) rc = ::posix_spawn_file_actions_adddup2(actions.get(), out_fd, STDERR_FILENO);
    if (rc != 0) {
        ::close(out_fd);
        return launch_failure(request, start,
            "Cannot prepare child file actions: " + std::string(strerror(rc)));
    }

    auto args = build_argv(request);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    pid_t pid = -1;
    rc = ::posix_spawnp(&pid, argv[0], actions.get(), nullptr, argv.data(), environ);
    ::close(out_fd);
    if (rc != 0) {
        return launch_failure(request, start,
            "Failed to launch " + args.front() + ": " + std::string(strerror(rc)));
    }

    int status = 0;
    pid_t waited;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited < 0) {
        return launch_failure(request, start,
            "waitpid failed: " + std::string(strerror(errno)));
    }

    ExecutionResult result;
    result.name = request.name;
    result.duration = std::chrono::duration_cast<Milliseconds>(
        std::chrono::steady_clock::now() - start);
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
    }
    return result;
}

}  // namespace task_orchestrator
