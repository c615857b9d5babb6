#include "tasks/task_registry.hpp"

#include <utility>

namespace devtask::tasks {

bool TaskRegistry::Register(std::string name, std::string description, TaskAction action,
                            std::string& error) {
  error.clear();

  if (name.empty()) {
    error = "task name cannot be empty";
    return false;
  }
  if (!action) {
    error = "task '" + name + "' has no action";
    return false;
  }
  if (Contains(name)) {
    error = "duplicate task name: " + name;
    return false;
  }

  entries_.push_back(TaskEntry{std::move(name), std::move(description), std::move(action)});
  return true;
}

// Linear scan: the table holds a handful of entries and must stay ordered.
const TaskEntry* TaskRegistry::Resolve(std::string_view name) const {
  for (const auto& entry : entries_) {
    if (entry.name == name) {
      return &entry;
    }
  }
  return nullptr;
}

} // namespace devtask::tasks
