#include "cli.hpp"
#include "clock.hpp"
#include "llama_reorderer.hpp"
#include "scheduler.hpp"
#include "task_io.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

int main(int argc, char** argv) {
  try {
    auto args = parse_cli(argc, argv);
    auto category = category_from_string(args.schedule_type);
    auto profile = load_profile(args.profile_path);
    auto tasks = load_tasks(args.tasks_path);

    Instant now = local_now();
    if (!args.now.empty()) {
      auto t = parse_hhmm(args.now);
      if (!t) { std::cerr << "Bad --now value: " << args.now << "\n"; return 1; }
      now = *t;
    }
    std::cerr << "Loaded " << tasks.size() << " tasks, scheduling from "
              << format_clock(now) << "\n";

    std::unique_ptr<Reorderer> reorderer;
    if (args.reorder) reorderer = std::make_unique<LlamaReorderer>(args.models, args.max_tokens);

    auto placed = schedule_tasks(tasks, profile, category, now, reorderer.get());

    if (args.json) {
      std::cout << schedule_to_json(placed).dump(2) << "\n";
      return 0;
    }
    if (placed.empty()) {
      std::cout << "No tasks could be scheduled.\n";
      return 0;
    }
    for (const auto& p : placed) {
      std::cout << p.start_time() << " - " << p.end_time() << "  " << p.description << "\n";
    }
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
  }
}
