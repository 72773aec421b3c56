/**
 * @file manifest.cpp
 * @brief Manifest parsing with toml++.
 */

#include "workload/manifest.hpp"

#include "core/clock.hpp"

#include <toml++/toml.hpp>

namespace task_orchestrator {

namespace {

Result<std::vector<std::string>> read_string_array(const toml::table& entry,
                                                   std::string_view key,
                                                   const std::string& where) {
    std::vector<std::string> out;
    const auto* node = entry.get(key);
    if (!node) return out;

    const auto* array = node->as_array();
    if (!array) {
        return Error{ErrorCode::InvalidArgument,
                     where + ": '" + std::string(key) + "' must be an array of strings"};
    }
    for (const auto& item : *array) {
        auto value = item.value<std::string>();
        if (!value) {
            return Error{ErrorCode::InvalidArgument,
                         where + ": '" + std::string(key) + "' must contain only strings"};
        }
        out.push_back(std::move(*value));
    }
    return out;
}

Result<ScheduleRequest> parse_entry(const toml::table& entry, size_t index, EpochMillis now) {
    const std::string where = "task #" + std::to_string(index + 1);

    ScheduleRequest request;
    auto name = entry["name"].value<std::string>();
    if (!name || name->empty()) {
        return Error{ErrorCode::InvalidArgument, where + ": missing 'name'"};
    }
    request.name = std::move(*name);

    auto program = entry["program"].value<std::string>();
    if (!program || program->empty()) {
        return Error{ErrorCode::InvalidArgument,
                     where + " (" + request.name + "): missing 'program'"};
    }
    request.program_path = std::move(*program);

    auto delay = entry["delay_ms"].value<int64_t>();
    auto at = entry["at_ms"].value<int64_t>();
    if (delay && at) {
        return Error{ErrorCode::InvalidArgument,
                     where + " (" + request.name + "): 'delay_ms' and 'at_ms' are exclusive"};
    }
    if (delay) {
        if (*delay < 0) {
            return Error{ErrorCode::InvalidArgument,
                         where + " (" + request.name + "): 'delay_ms' must be >= 0"};
        }
        request.scheduled_time = saturating_add(now, *delay);
    } else if (at) {
        request.scheduled_time = *at;
    }

    auto parameters = read_string_array(entry, "parameters", where);
    if (!parameters) return parameters.error();
    request.parameters = std::move(*parameters);

    auto depends_on = read_string_array(entry, "depends_on", where);
    if (!depends_on) return depends_on.error();
    request.depends_on = std::move(*depends_on);

    return request;
}

Result<std::vector<ScheduleRequest>> parse_tasks(const toml::table& root, EpochMillis now) {
    std::vector<ScheduleRequest> requests;

    const auto* node = root.get("task");
    if (!node) return requests;

    const auto* tasks = node->as_array();
    if (!tasks) {
        return Error{ErrorCode::InvalidArgument, "'task' must be an array of tables ([[task]])"};
    }

    for (size_t i = 0; i < tasks->size(); ++i) {
        const auto* entry = tasks->get(i)->as_table();
        if (!entry) {
            return Error{ErrorCode::InvalidArgument,
                         "task #" + std::to_string(i + 1) + " is not a table"};
        }
        auto request = parse_entry(*entry, i, now);
        if (!request) return request.error();
        requests.push_back(std::move(*request));
    }
    return requests;
}

}  // anonymous namespace

Result<std::vector<ScheduleRequest>> parse_manifest(std::string_view text, EpochMillis now) {
    try {
        auto root = toml::parse(text);
        return parse_tasks(root, now);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::InvalidConfiguration,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<std::vector<ScheduleRequest>> load_manifest(const std::filesystem::path& path,
                                                   EpochMillis now) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::InvalidConfiguration,
                     "Manifest file not found: " + path.string()};
    }

    try {
        auto root = toml::parse_file(path.string());
        return parse_tasks(root, now);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::InvalidConfiguration,
                     std::string{"TOML parse error in "} + path.string() + ": "
                     + std::string{err.description()}};
    }
}

}  // namespace task_orchestrator
