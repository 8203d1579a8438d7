#pragma once
#include "clock.hpp"
#include "task.hpp"
#include <optional>
#include <string>
#include <vector>

// One accepted "finish by" phrase form in a task description.
struct DeadlineShape {
  const char* example;
  const char* pattern;   // RE2; groups: hour, [minute,] am|pm
  bool has_minutes;
};

const std::vector<DeadlineShape>& deadline_shapes();

// Earliest "before/by H[:MM] am|pm" phrase in text, as a time of day.
std::optional<Instant> parse_deadline_phrase(const std::string& text);

// The task's "HH:MM" field, then the description phrase, clipped to
// window_end. nullopt means the task has no deadline.
std::optional<Instant> extract_deadline(const Task& task, Instant window_end);
