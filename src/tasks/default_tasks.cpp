#include "tasks/default_tasks.hpp"

#include "probe/probe_target.hpp"
#include "tasks/check_task.hpp"
#include "tasks/help_task.hpp"

namespace devtask::tasks {

bool BuildDefaultTaskRegistry(const core::config::Settings& settings, TaskRegistry& registry,
                              std::string& error) {
  if (!registry.Register(kHelpTaskName, kHelpTaskDescription, RunHelpTask, error)) {
    return false;
  }

  return registry.Register(kCheckTaskName,
                           kCheckTaskDescription,
                           MakeCheckTask(probe::DefaultProbeTarget(), settings.probe_timeout),
                           error);
}

} // namespace devtask::tasks
