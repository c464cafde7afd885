#include "mlfq_sim/scheduler.hpp"
#include <iostream>

using namespace mlfq_sim;

int main() {
  std::cout << "Example: boost vs. starvation (lowest tier requeues)\n";

  Config cfg;
  cfg.quanta = {10, 20, 40};
  cfg.lowest = LowestTierPolicy::Requeue;
  cfg = config_from_env(cfg);
  Scheduler sched(cfg);

  std::size_t boosts = 0;
  sched.set_trace([&](const TraceEvent& ev) {
    switch (ev.kind) {
      case TraceKind::Exec:
        std::cout << "[t=" << ev.time << "] tier " << ev.tier << ": " << format_exec(ev) << "\n";
        break;
      case TraceKind::Boost:
        ++boosts;
        std::cout << "[t=" << ev.time << "] boost, " << ev.executed << " back to tier 0\n";
        break;
      default:
        break;
    }
  });

  // CPU hogs; the clock lands on t=100 while all three sit in lower tiers
  sched.add_process({1, 0, 60, 0});
  sched.add_process({2, 0, 40, 0});
  sched.add_process({3, 0, 70, 0});
  // short job
  sched.add_process({4, 0, 10, 0});

  std::size_t n = run_until_idle(sched);

  dump_tiers(std::cout, sched);
  std::cout << "Done. " << n << " dispatches, " << boosts << " boosts, t=" << sched.current_time() << "\n";
}
