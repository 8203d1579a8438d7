#pragma once
#include "clock.hpp"
#include <chrono>
#include <vector>

constexpr std::chrono::minutes FORCED_BREAK{5};

struct Interval {
  Instant start;
  Instant end;    // exclusive
};

using Occupied = std::vector<Interval>;

// True if [start, end) overlaps no occupied interval.
bool clear_of(Instant start, Instant end, const Occupied& occupied);

// True if [start, end) is non-empty, lies inside [window_start, window_end]
// and touches no occupied interval except at an endpoint.
bool fits(Instant start, Instant end, const Occupied& occupied,
          Instant window_start, Instant window_end);

// fits() for the task, and its trailing break clear of occupied time. The
// break may run past window_end.
bool fits_with_break(Instant start, Instant end, const Occupied& occupied,
                     Instant window_start, Instant window_end);

// Commits [start, end) followed by its forced break [end, end + 5min).
void add_with_break(Occupied& occupied, Instant start, Instant end);

// Sorted by start, pairwise disjoint; touching intervals are fused.
Occupied merge(Occupied occupied);
