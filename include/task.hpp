#pragma once
#include "clock.hpp"
#include <optional>
#include <string>

enum class Level { Low, Medium, High };

enum class ScheduleCategory {
  Workday,   // window ends at profile work_hours.end
  Personal,  // fixed window of PERSONAL_WINDOW from now
};

constexpr int MIN_DURATION = 5;
constexpr int MAX_DURATION = 240;
constexpr int DEFAULT_DURATION = 30;

struct Task {
  std::string description;
  Level priority = Level::Medium;
  Level energy = Level::Medium;
  int duration_min = DEFAULT_DURATION;
  std::optional<std::string> deadline;   // "HH:MM", finish-by
};

struct PlacedTask {
  std::string description;
  Instant start;
  Instant end;

  std::string start_time() const { return format_clock(start); }
  std::string end_time() const { return format_clock(end); }
};

struct WorkHours {
  std::string start = "09:00";
  std::string end = "17:00";
};

struct EnergyLevels {
  Level morning = Level::High;
  Level afternoon = Level::Medium;
  Level evening = Level::Low;
};

// Only work_hours.end affects packing; the rest is forwarded to the
// reorder service.
struct Profile {
  WorkHours work_hours;
  int break_duration_min = 15;
  EnergyLevels energy_levels;
};

int clamp_duration(int minutes);
const char* level_name(Level l);
const char* category_name(ScheduleCategory c);
