#pragma once
#include <string>
#include <vector>

struct Args {
  std::string tasks_path;
  std::string profile_path = "./profile.json";
  std::string schedule_type = "personal";   // "work" | "personal"
  std::string now;                          // "HH:MM", empty = wall clock
  std::vector<std::string> models;          // tried in order
  int max_tokens = 1200;
  bool reorder = true;
  bool json = false;
};

Args parse_cli(int argc, char** argv);
