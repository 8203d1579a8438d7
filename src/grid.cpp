#include "grid.hpp"

using std::chrono::minutes;

// Minutes past the last grid mark, in [0, GRID_STEP).
static minutes past_mark(minutes m) {
  return ((m % GRID_STEP) + GRID_STEP) % GRID_STEP;
}

Instant round_up(Instant t) {
  minutes m = std::chrono::floor<minutes>(t);
  minutes rem = past_mark(m);
  if (rem == minutes(0)) return m;
  return m - rem + GRID_STEP;
}

Instant round_down(Instant t) {
  minutes m = std::chrono::floor<minutes>(t);
  return m - past_mark(m);
}
