#pragma once

#include "core/logging/logger.hpp"
#include "tasks/task_registry.hpp"

#include <ostream>
#include <string_view>
#include <vector>

namespace devtask::cli {

// Resolves `args[0]` against `registry` and runs the bound task.
//
// - no arguments, or `help`: prints the task listing and returns 0, even when
//   the registry has no `help` entry
// - a registered name: returns that task's exit status
// - anything else: diagnostic on `err`, returns 1, runs nothing
//
// Arguments after the task name are ignored.
int DispatchTask(const tasks::TaskRegistry& registry, const std::vector<std::string_view>& args,
                 std::ostream& out, std::ostream& err, core::logging::Logger& logger);

// Process entry: loads settings from the environment, builds the default task
// table, and dispatches `argv[1]` with std::cout/std::cerr.
//   0 => success
//   1 => unknown task, probe failure, or invalid configuration
int Dispatch(int argc, char** argv);

} // namespace devtask::cli
