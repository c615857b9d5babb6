#include "tasks/help_task.hpp"

#include "core/errors/exit_codes.hpp"
#include "core/logging/logger.hpp"

#include <string>
#include <string_view>

namespace devtask::tasks {

void WriteTaskListing(const TaskRegistry& registry, std::ostream& out) {
  out << "Available targets:\n";
  for (const auto& entry : registry.List()) {
    const std::string_view description = entry.description;
    out << "  - " << entry.name << ": " << description;
    if (description.empty() || description.back() != '.') {
      out << '.';
    }
    out << '\n';
  }
}

int RunHelpTask(TaskContext& context) {
  context.logger.Debug("listing tasks", {{"count", std::to_string(context.registry.Size())}});
  WriteTaskListing(context.registry, context.out);
  context.out.flush();
  return core::errors::ToInt(core::errors::ExitCode::kSuccess);
}

} // namespace devtask::tasks
