#include "placer.hpp"
#include "grid.hpp"
#include <algorithm>

std::optional<Interval> find_backward_slot(Instant deadline, std::chrono::minutes duration,
                                           const Occupied& occupied, Instant window_start) {
  Instant end = round_down(deadline);
  for (int i = 0; i < MAX_SLOT_STEPS; ++i) {
    Instant start = round_up(end - duration);
    end = start + duration;
    if (fits_with_break(start, end, occupied, window_start, deadline)) return Interval{start, end};
    end -= GRID_STEP;
    if (end <= window_start) break;
  }
  return std::nullopt;
}

std::optional<Interval> find_forward_slot(Instant cursor, std::chrono::minutes duration,
                                          const Occupied& occupied,
                                          Instant window_start, Instant window_end) {
  Instant start = round_up(std::max(cursor, window_start));
  for (int i = 0; i < MAX_SLOT_STEPS && start + duration <= window_end; ++i) {
    if (fits_with_break(start, start + duration, occupied, window_start, window_end)) {
      return Interval{start, start + duration};
    }
    start += GRID_STEP;
  }
  return std::nullopt;
}
