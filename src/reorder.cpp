#include "reorder.hpp"
#include "task_io.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

using json = nlohmann::json;

namespace {
const char* INSTRUCTIONS =
"Reorder tasks to maximize productivity, respecting durations where reasonable. "
"Prefer high-energy tasks during the user's higher energy periods. "
"Return ONLY a JSON array of tasks with the SAME schema "
"(description, priority, energy, duration).";

std::string fold(const std::string& s) {
  auto a = s.find_first_not_of(" \t\r\n");
  auto b = s.find_last_not_of(" \t\r\n");
  if (a == std::string::npos) return "";
  std::string out = s.substr(a, b - a + 1);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  return out;
}

// First balanced [...] in text, skipping brackets inside JSON strings.
std::string extract_first_json_array(const std::string& text) {
  size_t start = text.find('[');
  if (start == std::string::npos) return "";
  int depth = 0;
  bool in_str = false, esc = false;
  for (size_t i = start; i < text.size(); ++i) {
    char c = text[i];
    if (in_str) {
      if (esc) esc = false;
      else if (c == '\\') esc = true;
      else if (c == '"') in_str = false;
      continue;
    }
    if (c == '"') in_str = true;
    else if (c == '[') depth++;
    else if (c == ']') {
      if (--depth == 0) return text.substr(start, i - start + 1);
    }
  }
  return "";
}
}

void ArrayWatcher::feed(const std::string& piece) {
  for (char c : piece) {
    if (closed()) return;
    if (!opened_) {
      if (c == '[') { opened_ = true; depth_ = 1; }
      continue;
    }
    if (in_str_) {
      if (esc_) esc_ = false;
      else if (c == '\\') esc_ = true;
      else if (c == '"') in_str_ = false;
    } else if (c == '"') in_str_ = true;
    else if (c == '[') depth_++;
    else if (c == ']') depth_--;
  }
}

std::string build_reorder_prompt(const std::vector<Task>& tasks, const Profile& profile,
                                 ScheduleCategory category) {
  json p = profile_to_json(profile);
  json payload = {
    {"schedule_type", category_name(category)},
    {"profile", p},
    {"tasks", json::array()},
  };
  for (const auto& t : tasks) payload["tasks"].push_back(task_to_json(t));

  std::string prompt;
  prompt.reserve(2048);
  prompt.append(INSTRUCTIONS);
  prompt.append("\n\n");
  prompt.append(payload.dump());
  return prompt;
}

std::vector<Task> parse_reorder_output(const std::string& raw) {
  json j = json::parse(raw, nullptr, /*allow_exceptions=*/false);
  if (!j.is_array()) {
    std::string arr = extract_first_json_array(raw);
    if (arr.empty()) return {};
    j = json::parse(arr, nullptr, false);
    if (!j.is_array()) return {};
  }

  std::vector<Task> out;
  for (const auto& item : j) {
    auto t = task_from_json(item);
    if (!t) continue;
    t->deadline.reset();
    out.push_back(std::move(*t));
  }
  return out;
}

ReorderOutcome request_reorder(Reorderer& service, const std::vector<Task>& tasks,
                               const Profile& profile, ScheduleCategory category) {
  ReorderOutcome r;
  try {
    r.tasks = parse_reorder_output(service.complete(build_reorder_prompt(tasks, profile, category)));
  } catch (const std::exception& e) {
    r.reason = e.what();
    return r;
  }
  if (r.tasks.empty()) {
    r.reason = "no valid task array in response";
    return r;
  }

  // Each original lends its deadline to at most one reordered task.
  std::vector<bool> used(tasks.size(), false);
  for (auto& t : r.tasks) {
    std::string key = fold(t.description);
    for (size_t i = 0; i < tasks.size(); ++i) {
      if (used[i] || fold(tasks[i].description) != key) continue;
      t.deadline = tasks[i].deadline;
      used[i] = true;
      break;
    }
  }
  r.ok = true;
  return r;
}
