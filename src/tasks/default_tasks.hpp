#pragma once

#include "core/config/settings.hpp"
#include "tasks/task_registry.hpp"

#include <string>

namespace devtask::tasks {

// Registers the built-in tasks in listing order: `help`, then `check`
// against the compiled-in probe target.
bool BuildDefaultTaskRegistry(const core::config::Settings& settings, TaskRegistry& registry,
                              std::string& error);

} // namespace devtask::tasks
