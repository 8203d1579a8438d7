#pragma once
#include "task.hpp"
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

// Lenient field coercion shared by the task loader and the reorder parser.
Level coerce_level(const nlohmann::json& v);
int coerce_duration(const nlohmann::json& v);   // clamped to [5, 240]

// nullopt if the item is not an object or its description is blank.
std::optional<Task> task_from_json(const nlohmann::json& item);

// Throws std::runtime_error if j is not an array; bad items are skipped.
std::vector<Task> tasks_from_json(const nlohmann::json& j);
nlohmann::json task_to_json(const Task& t);

Profile profile_from_json(const nlohmann::json& j);
nlohmann::json profile_to_json(const Profile& p);

nlohmann::json schedule_to_json(const std::vector<PlacedTask>& placed);

std::vector<Task> load_tasks(const std::string& path);
// A missing file yields the default profile.
Profile load_profile(const std::string& path);

ScheduleCategory category_from_string(const std::string& s);
