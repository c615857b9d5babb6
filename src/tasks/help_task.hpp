#pragma once

#include "tasks/task_context.hpp"
#include "tasks/task_registry.hpp"

#include <ostream>

namespace devtask::tasks {

inline constexpr const char* kHelpTaskName = "help";
inline constexpr const char* kHelpTaskDescription = "Display this help message.";

// Writes:
//   Available targets:
//     - <name>: <description>.
// with one entry line per task in registration order. Descriptions that
// already end in '.' are not given a second one.
void WriteTaskListing(const TaskRegistry& registry, std::ostream& out);

// Task body for `help`. Always succeeds.
int RunHelpTask(TaskContext& context);

} // namespace devtask::tasks
