#pragma once
#include "task.hpp"
#include <string>
#include <vector>

// Text-generation backend asked to reorder the day's tasks.
class Reorderer {
public:
  virtual ~Reorderer() = default;

  // Raw completion for prompt. Throws std::runtime_error on failure.
  virtual std::string complete(const std::string& prompt) = 0;
};

struct ReorderOutcome {
  bool ok = false;
  std::vector<Task> tasks;   // reordered, validated; empty unless ok
  std::string reason;        // why the reorder was rejected
};

// Fed a streamed completion piece by piece; closed() once the first JSON
// array has been balanced. Text before the first '[' is ignored.
class ArrayWatcher {
public:
  void feed(const std::string& piece);
  bool closed() const { return opened_ && depth_ == 0; }

private:
  int depth_ = 0;
  bool opened_ = false;
  bool in_str_ = false;
  bool esc_ = false;
};

std::string build_reorder_prompt(const std::vector<Task>& tasks, const Profile& profile,
                                 ScheduleCategory category);

// Validated tasks from the first JSON array in raw. Invalid items are
// skipped; anything unusable yields an empty list. Deadlines are not read.
std::vector<Task> parse_reorder_output(const std::string& raw);

// Never throws. On success each task whose description matches a not yet
// claimed original task (case-insensitive) carries that task's deadline.
ReorderOutcome request_reorder(Reorderer& service, const std::vector<Task>& tasks,
                               const Profile& profile, ScheduleCategory category);
