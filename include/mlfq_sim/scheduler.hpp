#ifndef MLFQ_SIM_SCHEDULER_HPP
#define MLFQ_SIM_SCHEDULER_HPP

#include <cstddef>
#include <cstdint>
#include <deque>
#include <ostream>
#include <utility>
#include <vector>

#include "mlfq_sim/config.hpp"
#include "mlfq_sim/trace.hpp"

namespace mlfq_sim {

struct Process {
  std::uint32_t id = 0;
  std::size_t   priority = 0;            // tier index, 0 is highest
  std::uint32_t remaining_time = 0;
  std::uint32_t total_executed_time = 0;
};

using Tier = std::deque<Process>;

// Multi-level feedback queue. Tier 0 has the highest priority; each tier has
// its own quantum. Not thread safe. The clock is a 32-bit counter and wraps
// modulo 2^32 without any check.
class Scheduler {
public:
  // Throws std::invalid_argument if num_levels is 0 or the quanta table
  // does not have num_levels entries.
  Scheduler(std::size_t num_levels, std::vector<std::uint32_t> time_quanta);
  explicit Scheduler(const Config& cfg);

  // Queue at the tail of the tier named by process.priority. Out-of-range
  // priorities go to the lowest tier. A record with no remaining time is
  // reported as finished and not queued.
  void add_process(Process process);

  // Run the next process of a tier for at most one quantum, then demote,
  // finish or drop it. No-op on an empty tier. Throws std::out_of_range
  // for a bad tier index.
  void execute_process(std::size_t tier_index);

  // Move every process in tiers 1..N-1 to the tail of tier 0.
  void priority_boost();

  // Advance the clock; boosts when the new time is a multiple of the
  // boost interval.
  void update_time(std::uint32_t elapsed);

  void set_order(DispatchOrder o) { order_ = o; }
  void set_lowest_policy(LowestTierPolicy p) { lowest_ = p; }
  // Called after the state change it reports. An exception thrown by the
  // sink propagates to the caller; the scheduler state is already updated.
  void set_trace(TraceFunc fn) { trace_ = std::move(fn); }

  DispatchOrder    order() const { return order_; }
  LowestTierPolicy lowest_policy() const { return lowest_; }
  std::uint32_t    boost_interval() const { return boost_interval_; }

  const std::vector<Tier>&          tiers() const { return tiers_; }
  const Tier&                       tier(std::size_t index) const { return tiers_.at(index); }
  std::size_t                       num_levels() const { return num_levels_; }
  const std::vector<std::uint32_t>& time_quanta() const { return time_quanta_; }
  std::uint32_t                     current_time() const { return current_time_; }

  bool empty() const;
  std::size_t size() const;

private:
  Process take_next(Tier& q);
  void emit(TraceKind kind, const Process& p, std::size_t tier, std::uint32_t executed);

  std::vector<Tier>          tiers_;
  std::size_t                num_levels_;
  std::vector<std::uint32_t> time_quanta_;
  std::uint32_t              current_time_ = 0;
  std::uint32_t              boost_interval_ = kDefaultBoostInterval;
  DispatchOrder              order_ = DispatchOrder::Lifo;
  LowestTierPolicy           lowest_ = LowestTierPolicy::Drop;
  TraceFunc                  trace_;
};

// Driver loop: dispatch the highest non-empty tier, then update_time(0),
// until every tier is empty. Returns the number of dispatches.
std::size_t run_until_idle(Scheduler& sched);

// Process { id: 1, priority: 0, remaining_time: 10, total_executed_time: 0 }
std::ostream& operator<<(std::ostream& os, const Process& p);

// One "Queue <i>: [...]" line per tier.
void dump_tiers(std::ostream& os, const Scheduler& sched);

} // namespace mlfq_sim

#endif // MLFQ_SIM_SCHEDULER_HPP
