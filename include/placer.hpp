#pragma once
#include "intervals.hpp"
#include <chrono>
#include <optional>

// 12 hours of quarter-hour steps, plus the starting candidate.
constexpr int MAX_SLOT_STEPS = 12 * 4 + 1;

// Both placers also keep the slot's trailing break clear of occupied time.

// Latest grid-aligned slot of `duration` that ends at or before `deadline`
// and starts no earlier than window_start.
std::optional<Interval> find_backward_slot(Instant deadline, std::chrono::minutes duration,
                                           const Occupied& occupied, Instant window_start);

// Earliest grid-aligned slot of `duration` starting at or after `cursor`.
std::optional<Interval> find_forward_slot(Instant cursor, std::chrono::minutes duration,
                                          const Occupied& occupied,
                                          Instant window_start, Instant window_end);
