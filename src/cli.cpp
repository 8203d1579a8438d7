#include "cli.hpp"
#include <cstdlib>
#include <iostream>

static const char* USAGE =
"daypack <tasks.json> [--profile path] [--type work|personal] [--now HH:MM]\n"
"        [--model path]... [--max-tokens N] [--no-reorder] [--json]\n";

Args parse_cli(int argc, char** argv) {
  Args a;
  if (argc < 2) { std::cerr << USAGE; std::exit(1); }
  int i = 1;

  while (i < argc) {
    std::string f = argv[i++];
    auto next = [&](std::string& dst){
      if (i >= argc) { std::cerr << "Missing value after " << f << "\n"; std::exit(1); }
      dst = argv[i++];
    };
    if (f == "--profile") next(a.profile_path);
    else if (f == "--type") next(a.schedule_type);
    else if (f == "--now") next(a.now);
    else if (f == "--model") { std::string v; next(v); a.models.push_back(v); }
    else if (f == "--max-tokens") { std::string v; next(v); a.max_tokens = std::stoi(v); }
    else if (f == "--no-reorder") a.reorder = false;
    else if (f == "--json") a.json = true;
    else if (f == "-h" || f == "--help") { std::cout << USAGE; std::exit(0); }
    else if (!f.empty() && f[0] == '-') { std::cerr << "Unknown flag: " << f << "\n"; std::exit(1); }
    else if (a.tasks_path.empty()) a.tasks_path = f;
    else { std::cerr << USAGE; std::exit(1); }
  }
  if (a.tasks_path.empty()) { std::cerr << USAGE; std::exit(1); }
  if (a.models.empty()) a.models.push_back("./models/instruct.gguf");
  return a;
}
