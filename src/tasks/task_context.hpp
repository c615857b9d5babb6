#pragma once

#include <ostream>

namespace devtask::core::logging {
class Logger;
}

namespace devtask::tasks {

class TaskRegistry;

// Everything a task may touch while it runs. Streams are injected so the
// dispatcher can point them at std::cout/std::cerr and tests at buffers.
struct TaskContext {
  const TaskRegistry& registry;
  std::ostream& out;
  std::ostream& err;
  core::logging::Logger& logger;
};

} // namespace devtask::tasks
