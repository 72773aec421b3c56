/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

namespace task_orchestrator {

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::InvalidConfiguration,
                     "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [output]
        if (auto output = tbl["output"]; output.is_table()) {
            config.output.dir = output["dir"].value_or(std::string{"./task_output"});
            config.output.create_if_missing = output["create_if_missing"].value_or(false);
            config.output.extension = output["extension"].value_or(std::string{".out"});
        }

        // [executor]
        if (auto executor = tbl["executor"]; executor.is_table()) {
            auto workers = executor["workers"].value_or(int64_t{0});
            if (workers < 0) {
                return Error{ErrorCode::InvalidConfiguration,
                             "executor.workers must be >= 0"};
            }
            config.executor.workers = static_cast<uint32_t>(workers);
            config.executor.interpreter = executor["interpreter"].value_or(std::string{});
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});

            auto level = parse_log_level(telemetry["log_level"].value_or(std::string{"info"}));
            if (!level) return level.error();
            config.telemetry.log_level = *level;

            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.events = telemetry["events"].value_or(false);
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::InvalidConfiguration,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace task_orchestrator
