#include "intervals.hpp"
#include <algorithm>

bool clear_of(Instant start, Instant end, const Occupied& occupied) {
  for (const auto& o : occupied) {
    if (!(end <= o.start || start >= o.end)) return false;
  }
  return true;
}

bool fits(Instant start, Instant end, const Occupied& occupied,
          Instant window_start, Instant window_end) {
  if (start < window_start || end > window_end || start >= end) return false;
  return clear_of(start, end, occupied);
}

bool fits_with_break(Instant start, Instant end, const Occupied& occupied,
                     Instant window_start, Instant window_end) {
  return fits(start, end, occupied, window_start, window_end) &&
         clear_of(end, end + FORCED_BREAK, occupied);
}

void add_with_break(Occupied& occupied, Instant start, Instant end) {
  occupied.push_back({start, end});
  occupied.push_back({end, end + FORCED_BREAK});
}

Occupied merge(Occupied occupied) {
  if (occupied.empty()) return occupied;
  std::sort(occupied.begin(), occupied.end(),
            [](const Interval& a, const Interval& b) { return a.start < b.start; });
  Occupied out;
  out.push_back(occupied.front());
  for (size_t i = 1; i < occupied.size(); ++i) {
    const auto& iv = occupied[i];
    if (iv.start <= out.back().end) {
      out.back().end = std::max(out.back().end, iv.end);
    } else {
      out.push_back(iv);
    }
  }
  return out;
}
