#pragma once
#include <chrono>
#include <optional>
#include <string>

// Seconds from local midnight of the scheduling day. Values past 24h belong
// to the following day; the core never needs a calendar date.
using Instant = std::chrono::seconds;

Instant at_time_of_day(int hour, int minute);

// Strict 24-hour "HH:MM" (two digits each). Out-of-range values are absent.
std::optional<Instant> parse_hhmm(const std::string& hhmm);

// 12-hour display without a leading zero: "9:05 AM", "12:00 PM".
std::string format_clock(Instant t);

// Current local wall-clock time of day.
Instant local_now();
