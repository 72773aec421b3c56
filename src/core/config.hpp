/**
 * @file config.hpp
 * @brief Orchestrator configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/logger.hpp"
#include "core/result.hpp"

namespace task_orchestrator {

struct OutputConfig {
    std::filesystem::path dir = "./task_output";
    bool create_if_missing = false;
    std::string extension = ".out";
};

struct ExecutorConfig {
    uint32_t workers = 0;               ///< 0 = hardware_concurrency
    std::string interpreter;            ///< Prepended to argv when non-empty, e.g. "python3"
};

struct TelemetryConfig {
    std::filesystem::path log_dir;      ///< Empty = stdout
    LogLevel log_level = LogLevel::Info;
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    bool events = false;                ///< Write lifecycle events to `task_events.ndjson` in log_dir
};

/**
 * @brief Top-level orchestrator configuration.
 */
struct Config {
    OutputConfig output;
    ExecutorConfig executor;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Keys that are absent keep their defaults. A missing file, a parse error
 * or an unknown log level yields ErrorCode::InvalidConfiguration.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace task_orchestrator
