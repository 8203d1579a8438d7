#pragma once
#include "clock.hpp"
#include "reorder.hpp"
#include "task.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

constexpr std::chrono::hours PERSONAL_WINDOW{6};

struct Window {
  Instant start_from;
  Instant end;
};

enum class SkipReason { NoSlotBeforeDeadline, WindowExhausted };

struct SkippedTask {
  std::string description;
  SkipReason reason;
};

const char* skip_reason_name(SkipReason r);

// nullopt when the workday already ended (no schedule possible).
std::optional<Window> resolve_window(Instant now, const Profile& profile, ScheduleCategory category);

// Packs one day. Deadline tasks go backward from their due time (earliest
// due first), the rest forward from now in list order; every task is
// followed by a 5 minute break. Result is sorted by start. `reorderer` may
// be null; `skipped`, if given, receives the tasks that were dropped.
std::vector<PlacedTask> schedule_tasks(const std::vector<Task>& tasks, const Profile& profile,
                                       ScheduleCategory category, Instant now,
                                       Reorderer* reorderer = nullptr,
                                       std::vector<SkippedTask>* skipped = nullptr);
