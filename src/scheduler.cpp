#include "scheduler.hpp"
#include "deadline.hpp"
#include "grid.hpp"
#include "intervals.hpp"
#include "placer.hpp"
#include <algorithm>
#include <iostream>

namespace {
struct DeadlineTask {
  Instant due;
  const Task* task;
};

std::string trimmed(const std::string& s) {
  auto a = s.find_first_not_of(" \t\r\n");
  if (a == std::string::npos) return "";
  return s.substr(a, s.find_last_not_of(" \t\r\n") - a + 1);
}

void drop(const Task& t, SkipReason why, std::vector<SkippedTask>* skipped) {
  std::cerr << "[schedule] dropped \"" << t.description << "\": " << skip_reason_name(why) << "\n";
  if (skipped) skipped->push_back({t.description, why});
}
}

const char* skip_reason_name(SkipReason r) {
  return r == SkipReason::NoSlotBeforeDeadline ? "no slot before deadline" : "window exhausted";
}

std::optional<Window> resolve_window(Instant now, const Profile& profile, ScheduleCategory category) {
  Window w{round_up(now), Instant(0)};
  if (category == ScheduleCategory::Workday) {
    auto end = parse_hhmm(profile.work_hours.end);
    if (!end) {
      std::cerr << "[schedule] bad work_hours.end \"" << profile.work_hours.end << "\"\n";
      return std::nullopt;
    }
    if (*end <= w.start_from) return std::nullopt;
    w.end = *end;
  } else {
    w.end = w.start_from + PERSONAL_WINDOW;
  }
  return w;
}

std::vector<PlacedTask> schedule_tasks(const std::vector<Task>& tasks, const Profile& profile,
                                       ScheduleCategory category, Instant now,
                                       Reorderer* reorderer,
                                       std::vector<SkippedTask>* skipped) {
  std::vector<PlacedTask> placed;
  if (tasks.empty()) return placed;

  auto window = resolve_window(now, profile, category);
  if (!window) return placed;
  const Instant start_from = window->start_from;
  const Instant day_end = window->end;

  std::vector<Task> ordered;
  if (reorderer) {
    auto r = request_reorder(*reorderer, tasks, profile, category);
    if (r.ok) ordered = std::move(r.tasks);
    else std::cerr << "[reorder] keeping original order: " << r.reason << "\n";
  }
  const std::vector<Task>& work = ordered.empty() ? tasks : ordered;

  std::vector<DeadlineTask> deadline_tasks;
  std::vector<const Task*> normal_tasks;
  for (const auto& t : work) {
    if (t.description.find_first_not_of(" \t\r\n") == std::string::npos) continue;
    if (auto due = extract_deadline(t, day_end)) deadline_tasks.push_back({*due, &t});
    else normal_tasks.push_back(&t);
  }
  std::stable_sort(deadline_tasks.begin(), deadline_tasks.end(),
                   [](const DeadlineTask& a, const DeadlineTask& b) { return a.due < b.due; });

  Occupied occupied;
  for (const auto& d : deadline_tasks) {
    std::chrono::minutes dur(clamp_duration(d.task->duration_min));
    auto slot = find_backward_slot(d.due, dur, merge(occupied), start_from);
    if (!slot) {
      drop(*d.task, SkipReason::NoSlotBeforeDeadline, skipped);
      continue;
    }
    add_with_break(occupied, slot->start, slot->end);
    placed.push_back({trimmed(d.task->description), slot->start, slot->end});
  }

  occupied = merge(std::move(occupied));
  Instant cursor = start_from;
  for (const auto& o : occupied) {
    if (o.start <= cursor && cursor < o.end) cursor = o.end;
  }

  size_t next = 0;
  for (; next < normal_tasks.size(); ++next) {
    const Task& t = *normal_tasks[next];
    std::chrono::minutes dur(clamp_duration(t.duration_min));
    auto slot = find_forward_slot(cursor, dur, occupied, start_from, day_end);
    if (!slot) break;
    add_with_break(occupied, slot->start, slot->end);
    occupied = merge(std::move(occupied));
    placed.push_back({trimmed(t.description), slot->start, slot->end});
    cursor = slot->end + FORCED_BREAK;
    if (cursor >= day_end) {
      ++next;
      break;
    }
  }
  for (; next < normal_tasks.size(); ++next) {
    drop(*normal_tasks[next], SkipReason::WindowExhausted, skipped);
  }

  std::stable_sort(placed.begin(), placed.end(),
                   [](const PlacedTask& a, const PlacedTask& b) { return a.start < b.start; });
  return placed;
}
