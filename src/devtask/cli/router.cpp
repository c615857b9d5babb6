#include "devtask/cli/router.hpp"

#include "core/config/settings.hpp"
#include "core/errors/exit_codes.hpp"
#include "tasks/default_tasks.hpp"
#include "tasks/help_task.hpp"

#include <iostream>
#include <string>

namespace devtask::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  devtask [<task>]\n"
      << "run `devtask help` to list available tasks\n";
}

int RunTask(const tasks::TaskEntry& entry, const tasks::TaskRegistry& registry, std::ostream& out,
            std::ostream& err, core::logging::Logger& logger) {
  logger.SetTask(entry.name);
  tasks::TaskContext context{registry, out, err, logger};
  const int exit_code = entry.action(context);
  logger.Debug("task finished", {{"exit_code", std::to_string(exit_code)}});
  return exit_code;
}

} // namespace

int DispatchTask(const tasks::TaskRegistry& registry, const std::vector<std::string_view>& args,
                 std::ostream& out, std::ostream& err, core::logging::Logger& logger) {
  const std::string_view command = args.empty() ? std::string_view(tasks::kHelpTaskName)
                                                : args.front();

  if (command == tasks::kHelpTaskName) {
    logger.SetTask(tasks::kHelpTaskName);
    tasks::TaskContext context{registry, out, err, logger};
    return tasks::RunHelpTask(context);
  }

  const tasks::TaskEntry* entry = registry.Resolve(command);
  if (entry == nullptr) {
    logger.Debug("unknown task requested", {{"name", command}});
    err << "error: unknown task: " << command << '\n';
    PrintUsage(err);
    return kExitFailure;
  }

  return RunTask(*entry, registry, out, err, logger);
}

int Dispatch(int argc, char** argv) {
  core::config::Settings settings;
  std::string error;
  if (!core::config::LoadSettingsFromEnvironment(settings, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  core::logging::Logger logger(settings.log_level);

  tasks::TaskRegistry registry;
  if (!tasks::BuildDefaultTaskRegistry(settings, registry, error)) {
    std::cerr << "error: failed to build task table: " << error << '\n';
    return kExitFailure;
  }

  std::vector<std::string_view> args;
  if (argc > 1) {
    args.assign(argv + 1, argv + argc);
  }
  return DispatchTask(registry, args, std::cout, std::cerr, logger);
}

} // namespace devtask::cli
