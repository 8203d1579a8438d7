#include "deadline.hpp"
#include <re2/re2.h>
#include <algorithm>
#include <memory>

namespace {
struct CompiledShape {
  const DeadlineShape* shape;
  std::unique_ptr<RE2> re;
};

const std::vector<CompiledShape>& compiled_shapes() {
  static const std::vector<CompiledShape> compiled = [] {
    std::vector<CompiledShape> v;
    for (const auto& s : deadline_shapes()) {
      v.push_back({&s, std::make_unique<RE2>(s.pattern)});
    }
    return v;
  }();
  return compiled;
}

int to_int(re2::StringPiece sp) {
  int n = 0;
  for (char c : sp) n = n * 10 + (c - '0');
  return n;
}

// 12-hour clock to minutes from midnight; 12 am is midnight, 12 pm noon.
std::optional<Instant> to_24h(int hour, int minute, bool pm) {
  if (hour < 1 || hour > 12 || minute > 59) return std::nullopt;
  if (hour == 12) hour = 0;
  if (pm) hour += 12;
  return at_time_of_day(hour, minute);
}
}

const std::vector<DeadlineShape>& deadline_shapes() {
  static const std::vector<DeadlineShape> shapes = {
    {"by 5pm, before 5 pm",
     "(?i)\\b(?:before|by)\\s*(\\d{1,2})\\s*(am|pm)\\b", false},
    {"by 5:30pm, before 5 : 30 pm",
     "(?i)\\b(?:before|by)\\s*(\\d{1,2})\\s*:\\s*(\\d{2})\\s*(am|pm)\\b", true},
  };
  return shapes;
}

std::optional<Instant> parse_deadline_phrase(const std::string& text) {
  re2::StringPiece input(text);
  const char* best_at = nullptr;
  std::optional<Instant> best;

  for (const auto& c : compiled_shapes()) {
    re2::StringPiece groups[4];
    int n = c.shape->has_minutes ? 4 : 3;
    if (!c.re->Match(input, 0, input.size(), RE2::UNANCHORED, groups, n)) continue;
    if (best_at && groups[0].data() >= best_at) continue;

    int hour = to_int(groups[1]);
    int minute = c.shape->has_minutes ? to_int(groups[2]) : 0;
    re2::StringPiece ampm = groups[n - 1];
    bool pm = ampm[0] == 'p' || ampm[0] == 'P';

    best_at = groups[0].data();
    best = to_24h(hour, minute, pm);
  }
  return best;
}

std::optional<Instant> extract_deadline(const Task& task, Instant window_end) {
  std::optional<Instant> due;
  if (task.deadline) due = parse_hhmm(*task.deadline);
  if (!due) due = parse_deadline_phrase(task.description);
  if (!due) return std::nullopt;
  return std::min(*due, window_end);
}
