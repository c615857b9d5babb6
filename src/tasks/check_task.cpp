#include "tasks/check_task.hpp"

#include "core/errors/exit_codes.hpp"
#include "core/logging/logger.hpp"
#include "probe/http_probe.hpp"

#include <string>
#include <utility>

namespace devtask::tasks {

TaskAction MakeCheckTask(probe::ProbeTarget target, const std::chrono::milliseconds timeout) {
  return [target = std::move(target), timeout](TaskContext& context) {
    context.logger.Info("probing server",
                        {{"url", probe::FormatProbeUrl(target)},
                         {"timeout_ms", std::to_string(timeout.count())}});

    const probe::ProbeResult result =
        probe::RunHttpProbe(target, timeout, context.out, context.logger);
    if (!result.ok) {
      context.err << "error: " << probe::FormatProbeError(result.error_code, result.error)
                  << '\n';
      return core::errors::ToInt(core::errors::ExitCode::kFailure);
    }

    context.logger.Info("probe completed",
                        {{"status", std::to_string(result.status_code)},
                         {"headers", std::to_string(result.header_count)}});
    return core::errors::ToInt(core::errors::ExitCode::kSuccess);
  };
}

} // namespace devtask::tasks
