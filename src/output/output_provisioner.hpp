/**
 * @file output_provisioner.hpp
 * @brief Allocation of per-task output sinks.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace task_orchestrator {

/**
 * @brief Supplies the write destination for a newly admitted task.
 *
 * Called under the scheduling lock, so implementations must not block.
 */
class IOutputProvisioner {
public:
    virtual ~IOutputProvisioner() = default;

    virtual OutputSink allocate(const TaskName& name, AdmissionId admission_id) = 0;
};

/**
 * @brief One file per admission inside a validated directory.
 *
 * Paths are `<dir>/<sanitized-name>.<admission_id><extension>`. The file
 * itself is created by the executor when the task is dispatched.
 */
class DirectoryOutputProvisioner : public IOutputProvisioner {
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    /**
     * @brief Validate the output directory and build a provisioner.
     *
     * Fails with ErrorCode::InvalidConfiguration when the directory is
     * missing (and creation is disabled or fails), is not a directory, or
     * is not writable.
     */
    static Result<std::unique_ptr<DirectoryOutputProvisioner>> create(const OutputConfig& config);

    /// Reachable only through create().
    DirectoryOutputProvisioner(Passkey, std::filesystem::path dir, std::string extension);

    OutputSink allocate(const TaskName& name, AdmissionId admission_id) override;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return dir_; }

private:
    std::filesystem::path dir_;
    std::string extension_;
};

/// Replace every character outside [A-Za-z0-9._-] with '_'; empty or dot-only names become "_".
std::string sanitize_file_component(std::string_view name);

}  // namespace task_orchestrator
