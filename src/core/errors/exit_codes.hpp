#pragma once

namespace devtask::core::errors {

// Process-exit contract for scripts wrapping `devtask`.
//
// Unknown tasks, probe transport failures, and configuration errors all share
// the generic failure value; the stderr diagnostic carries the detail.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace devtask::core::errors
