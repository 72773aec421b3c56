/**
 * @file output_provisioner.cpp
 * @brief DirectoryOutputProvisioner implementation.
 */

#include "output/output_provisioner.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>
#include <unistd.h>

namespace task_orchestrator {

std::string sanitize_file_component(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')
                 || (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
        out += keep ? c : '_';
    }
    if (out.find_first_not_of('.') == std::string::npos) {
        return "_";
    }
    return out;
}

Result<std::unique_ptr<DirectoryOutputProvisioner>>
DirectoryOutputProvisioner::create(const OutputConfig& config) {
    const auto& dir = config.dir;
    if (dir.empty()) {
        return Error{ErrorCode::InvalidConfiguration, "Output directory is not set"};
    }

    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) {
        if (!config.create_if_missing) {
            return Error{ErrorCode::InvalidConfiguration,
                         "Output directory does not exist: " + dir.string()};
        }
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return Error{ErrorCode::InvalidConfiguration,
                         "Cannot create output directory " + dir.string() + ": " + ec.message()};
        }
    }

    if (!std::filesystem::is_directory(dir, ec)) {
        return Error{ErrorCode::InvalidConfiguration,
                     "Output path is not a directory: " + dir.string()};
    }

    if (::access(dir.c_str(), W_OK | X_OK) != 0) {
        return Error{ErrorCode::InvalidConfiguration,
                     "Output directory is not writable: " + dir.string() + ": "
                     + std::string(strerror(errno))};
    }

    auto absolute = std::filesystem::absolute(dir, ec);
    return std::make_unique<DirectoryOutputProvisioner>(
        Passkey{}, ec ? dir : absolute, config.extension);
}

DirectoryOutputProvisioner::DirectoryOutputProvisioner(Passkey,
                                                       std::filesystem::path dir,
                                                       std::string extension)
    : dir_(std::move(dir)), extension_(std::move(extension)) {}

OutputSink DirectoryOutputProvisioner::allocate(const TaskName& name, AdmissionId admission_id) {
    auto file = sanitize_file_component(name) + "." + std::to_string(admission_id) + extension_;
    return OutputSink{(dir_ / file).string()};
}

}  // namespace task_orchestrator
