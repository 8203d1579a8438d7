#include "task_io.hpp"
#include <nlohmann/json.hpp>
#include <re2/re2.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace {
std::string trim(const std::string& s) {
  auto a = s.find_first_not_of(" \t\r\n");
  auto b = s.find_last_not_of(" \t\r\n");
  if (a == std::string::npos) return "";
  return s.substr(a, b - a + 1);
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  return s;
}

json read_json_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("cannot open " + path);
  try {
    return json::parse(in);
  } catch (const json::parse_error& e) {
    throw std::runtime_error(path + ": " + e.what());
  }
}

json field(const json& obj, const char* key) {
  auto it = obj.find(key);
  return it == obj.end() ? json() : *it;
}

std::string hhmm_field(const json& obj, const char* key, const std::string& fallback) {
  if (!obj.is_object() || !obj.contains(key) || obj[key].is_null()) return fallback;
  if (!obj[key].is_string()) throw std::runtime_error(std::string("profile: ") + key + " must be HH:MM");
  std::string v = trim(obj[key].get<std::string>());
  if (!parse_hhmm(v)) throw std::runtime_error(std::string("profile: bad ") + key + ": " + v);
  return v;
}
}

Level coerce_level(const json& v) {
  if (!v.is_string()) return Level::Medium;
  std::string s = lower(trim(v.get<std::string>()));
  if (s == "low") return Level::Low;
  if (s == "high") return Level::High;
  return Level::Medium;
}

int coerce_duration(const json& v) {
  int minutes = DEFAULT_DURATION;
  if (v.is_number_integer()) {
    long long n = v.get<long long>();
    minutes = (int)std::max<long long>(MIN_DURATION, std::min<long long>(n, MAX_DURATION));
  } else if (v.is_number_float()) {
    double d = v.get<double>();
    if (d > MAX_DURATION) minutes = MAX_DURATION;
    else if (d < MIN_DURATION) minutes = MIN_DURATION;
    else minutes = (int)d;
  } else if (v.is_string()) {
    std::string s = lower(trim(v.get<std::string>()));
    int n = 0;
    if (s == "short") minutes = 15;
    else if (s == "medium") minutes = 30;
    else if (s == "long") minutes = 60;
    else if (RE2::FullMatch(s, "(-?\\d{1,6})", &n)) minutes = n;
  }
  return clamp_duration(minutes);
}

std::optional<Task> task_from_json(const json& item) {
  if (!item.is_object()) return std::nullopt;
  auto d = item.find("description");
  if (d == item.end() || !d->is_string()) return std::nullopt;

  Task t;
  t.description = trim(d->get<std::string>());
  if (t.description.empty()) return std::nullopt;

  t.priority = coerce_level(field(item, "priority"));
  t.energy = coerce_level(field(item, "energy"));
  t.duration_min = coerce_duration(field(item, "duration"));

  auto dl = item.find("deadline");
  if (dl != item.end() && dl->is_string()) {
    std::string s = trim(dl->get<std::string>());
    if (RE2::FullMatch(s, "\\d{2}:\\d{2}")) t.deadline = s;
  }
  return t;
}

std::vector<Task> tasks_from_json(const json& j) {
  if (!j.is_array()) throw std::runtime_error("tasks: expected a JSON array");
  std::vector<Task> out;
  for (const auto& item : j) {
    auto t = task_from_json(item);
    if (t) out.push_back(std::move(*t));
    else std::cerr << "[tasks] skipping invalid entry: " << item.dump() << "\n";
  }
  return out;
}

json task_to_json(const Task& t) {
  json j = {
    {"description", t.description},
    {"priority", level_name(t.priority)},
    {"energy", level_name(t.energy)},
    {"duration", t.duration_min},
  };
  j["deadline"] = t.deadline ? json(*t.deadline) : json(nullptr);
  return j;
}

Profile profile_from_json(const json& j) {
  Profile p;
  if (!j.is_object()) throw std::runtime_error("profile: expected a JSON object");
  if (j.contains("work_hours")) {
    const auto& wh = j["work_hours"];
    p.work_hours.start = hhmm_field(wh, "start", p.work_hours.start);
    p.work_hours.end = hhmm_field(wh, "end", p.work_hours.end);
  }
  if (j.contains("break_duration_min") && j["break_duration_min"].is_number()) {
    p.break_duration_min = j["break_duration_min"].get<int>();
  }
  if (j.contains("energy_levels") && j["energy_levels"].is_object()) {
    const auto& e = j["energy_levels"];
    if (e.contains("morning")) p.energy_levels.morning = coerce_level(e["morning"]);
    if (e.contains("afternoon")) p.energy_levels.afternoon = coerce_level(e["afternoon"]);
    if (e.contains("evening")) p.energy_levels.evening = coerce_level(e["evening"]);
  }
  return p;
}

json profile_to_json(const Profile& p) {
  return {
    {"work_hours", {{"start", p.work_hours.start}, {"end", p.work_hours.end}}},
    {"break_duration_min", p.break_duration_min},
    {"energy_levels", {
      {"morning", level_name(p.energy_levels.morning)},
      {"afternoon", level_name(p.energy_levels.afternoon)},
      {"evening", level_name(p.energy_levels.evening)},
    }},
  };
}

json schedule_to_json(const std::vector<PlacedTask>& placed) {
  json out = json::array();
  for (const auto& p : placed) {
    out.push_back({
      {"description", p.description},
      {"start_time", p.start_time()},
      {"end_time", p.end_time()},
    });
  }
  return out;
}

std::vector<Task> load_tasks(const std::string& path) {
  return tasks_from_json(read_json_file(path));
}

Profile load_profile(const std::string& path) {
  if (!std::filesystem::exists(path)) {
    std::cerr << "[profile] " << path << " not found, using defaults\n";
    return Profile{};
  }
  return profile_from_json(read_json_file(path));
}

ScheduleCategory category_from_string(const std::string& s) {
  std::string v = lower(trim(s));
  if (v == "work" || v == "work-related") return ScheduleCategory::Workday;
  if (v.rfind("personal", 0) == 0) return ScheduleCategory::Personal;
  throw std::runtime_error("unknown schedule type: " + s);
}
