#include "clock.hpp"
#include <re2/re2.h>
#include <cstdio>
#include <ctime>

Instant at_time_of_day(int hour, int minute) {
  return std::chrono::hours(hour) + std::chrono::minutes(minute);
}

std::optional<Instant> parse_hhmm(const std::string& hhmm) {
  static const RE2 re("(\\d{2}):(\\d{2})");
  int h = 0, m = 0;
  if (!RE2::FullMatch(hhmm, re, &h, &m)) return std::nullopt;
  if (h > 23 || m > 59) return std::nullopt;
  return at_time_of_day(h, m);
}

std::string format_clock(Instant t) {
  long long day = 24LL * 60;
  long long mins = std::chrono::duration_cast<std::chrono::minutes>(t).count();
  mins = ((mins % day) + day) % day;
  int h24 = (int)(mins / 60);
  int m = (int)(mins % 60);
  int h12 = h24 % 12 == 0 ? 12 : h24 % 12;
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%d:%02d %s", h12, m, h24 < 12 ? "AM" : "PM");
  return buf;
}

Instant local_now() {
  std::time_t t = std::time(nullptr);
  std::tm lt{};
#if defined(_WIN32)
  localtime_s(&lt, &t);
#else
  localtime_r(&t, &lt);
#endif
  return std::chrono::hours(lt.tm_hour) + std::chrono::minutes(lt.tm_min) +
         std::chrono::seconds(lt.tm_sec);
}
