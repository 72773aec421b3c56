/**
 * @file manifest.hpp
 * @brief TOML task manifests for the command-line runner.
 *
 * A manifest is an array of `[[task]]` tables:
 *
 *   [[task]]
 *   name = "extract"
 *   program = "/opt/jobs/extract.py"
 *   delay_ms = 1000            # relative to load time; or at_ms = <epoch ms>
 *   parameters = ["--full"]
 *   depends_on = []
 *
 * Entries are returned in file order, which is the order they are scheduled
 * in, so a dependency must appear before the tasks that name it.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "scheduler/scheduling_engine.hpp"

#include <filesystem>
#include <string_view>
#include <vector>

namespace task_orchestrator {

/**
 * @brief Load a manifest file.
 *
 * @param now  Epoch ms that `delay_ms` is relative to.
 * @return Schedule requests in file order. InvalidConfiguration when the
 *         file is missing or not TOML; InvalidArgument for a malformed entry.
 */
Result<std::vector<ScheduleRequest>> load_manifest(const std::filesystem::path& path,
                                                   EpochMillis now);

/**
 * @brief Parse manifest text (same rules as load_manifest).
 */
Result<std::vector<ScheduleRequest>> parse_manifest(std::string_view text, EpochMillis now);

}  // namespace task_orchestrator
