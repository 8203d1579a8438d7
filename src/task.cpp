#include "task.hpp"
#include <algorithm>

int clamp_duration(int minutes) {
  return std::max(MIN_DURATION, std::min(minutes, MAX_DURATION));
}

const char* level_name(Level l) {
  switch (l) {
    case Level::Low: return "low";
    case Level::High: return "high";
    default: return "medium";
  }
}

const char* category_name(ScheduleCategory c) {
  return c == ScheduleCategory::Workday ? "work-related" : "personal";
}
