#pragma once
#include "clock.hpp"
#include <chrono>

constexpr std::chrono::minutes GRID_STEP{15};

// Snap to the quarter-hour grid {:00, :15, :30, :45}. Seconds are dropped
// first, so 9:00:40 rounds up to 9:00. Both are idempotent.
Instant round_up(Instant t);
Instant round_down(Instant t);
