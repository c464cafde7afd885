#include "mlfq_sim/scheduler.hpp"
#include <iostream>

using namespace mlfq_sim;

int main() {
  std::cout << "Example: MLFQ (MLFQ_LEVELS, MLFQ_QUANTA, MLFQ_ORDER, MLFQ_LOWEST)\n";

  Config cfg = config_from_env();
  Scheduler sched(cfg);

  Logger csv(cfg.log_path);
  TraceFunc to_csv = csv.sink();
  sched.set_trace([&](const TraceEvent& ev) {
    if (ev.kind == TraceKind::Exec) std::cout << format_exec(ev) << "\n";
    to_csv(ev);
  });

  sched.add_process({1, 0, 10, 0});
  sched.add_process({2, 0, 3, 0});
  sched.add_process({3, 1, 5, 0});

  for (std::size_t lvl = 0; lvl < sched.num_levels(); ++lvl) {
    while (!sched.tier(lvl).empty()) sched.execute_process(lvl);
  }

  sched.update_time(100);

  dump_tiers(std::cout, sched);
  std::cout << "Done. Log: " << cfg.log_path << "\n";
}
