#include "pushapk/task/task.hpp"
#include "pushapk/core/logger.hpp"

#include <fstream>

namespace pushapk::task {

auto parse_task(const json& j) -> Result<TaskDescriptor> {
    if (!j.is_object()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidTask, "Task definition must be a JSON object"));
    }

    auto scopes_it = j.find("scopes");
    if (scopes_it == j.end() || !scopes_it->is_array()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidTask, "Task definition has no scopes array"));
    }

    TaskDescriptor task;
    for (const auto& scope : *scopes_it) {
        if (!scope.is_string()) {
            return std::unexpected(make_error(
                ErrorCode::InvalidTask, "Task scope is not a string", scope.dump()));
        }
        task.scopes.push_back(scope.get<std::string>());
    }

    if (auto payload_it = j.find("payload"); payload_it != j.end() && !payload_it->is_null()) {
        if (!payload_it->is_object()) {
            return std::unexpected(make_error(
                ErrorCode::InvalidTask, "Task payload must be a JSON object"));
        }
        task.payload = *payload_it;
    }

    return task;
}

auto load_task(const std::filesystem::path& path) -> Result<TaskDescriptor> {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(make_error(
            ErrorCode::IoError, "Cannot open task file", path.string()));
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::exception& e) {
        return std::unexpected(make_error(
            ErrorCode::InvalidTask, "Failed to parse task file", e.what()));
    }

    LOG_DEBUG("Loaded task definition from {}", path.string());
    return parse_task(j);
}

} // namespace pushapk::task
