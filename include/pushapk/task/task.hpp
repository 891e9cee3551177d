#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "pushapk/core/error.hpp"
#include "pushapk/core/types.hpp"

namespace pushapk::task {

/// The parts of a signed task definition this tool acts on. Scopes are
/// assumed to have been verified by the task queue before the task reaches us.
struct TaskDescriptor {
    std::vector<std::string> scopes;
    json payload = json::object();
};

/// Validate and extract a TaskDescriptor from a task definition document.
/// Requires a "scopes" array of strings; "payload" defaults to an empty object.
auto parse_task(const json& j) -> Result<TaskDescriptor>;

/// Read and parse a task definition file (task.json).
auto load_task(const std::filesystem::path& path) -> Result<TaskDescriptor>;

} // namespace pushapk::task
