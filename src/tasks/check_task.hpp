#pragma once

#include "probe/probe_target.hpp"
#include "tasks/task_registry.hpp"

#include <chrono>

namespace devtask::tasks {

inline constexpr const char* kCheckTaskName = "check";
inline constexpr const char* kCheckTaskDescription =
    "Runs a request including headers to our server";

// Binds an HTTP probe of `target` into a task body. The response dump goes to
// the context's stdout; failures are reported on its stderr and return 1.
TaskAction MakeCheckTask(probe::ProbeTarget target, std::chrono::milliseconds timeout);

} // namespace devtask::tasks
