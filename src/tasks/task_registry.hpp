#pragma once

#include "tasks/task_context.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace devtask::tasks {

// A task body. Returns the process exit status for the invocation.
using TaskAction = std::function<int(TaskContext&)>;

struct TaskEntry {
  std::string name;
  std::string description;
  TaskAction action;
};

// Ordered table of named tasks. Entries keep insertion order so the help
// listing is deterministic. Populate it once, then hand it out as const.
class TaskRegistry {
public:
  // Fails when `name` is empty, already registered, or `action` is empty.
  bool Register(std::string name, std::string description, TaskAction action,
                std::string& error);

  // Insertion-ordered view; iterating it again yields the same sequence.
  const std::vector<TaskEntry>& List() const {
    return entries_;
  }

  // Exact, case-sensitive lookup. Returns nullptr for unknown names.
  const TaskEntry* Resolve(std::string_view name) const;

  bool Contains(std::string_view name) const {
    return Resolve(name) != nullptr;
  }

  std::size_t Size() const {
    return entries_.size();
  }

  bool Empty() const {
    return entries_.empty();
  }

private:
  std::vector<TaskEntry> entries_;
};

} // namespace devtask::tasks
