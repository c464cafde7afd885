#include "mlfq_sim/scheduler.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace mlfq_sim {

// ------------------------------ Construction --------------------------------

Scheduler::Scheduler(std::size_t num_levels, std::vector<std::uint32_t> time_quanta)
  : num_levels_(num_levels), time_quanta_(std::move(time_quanta)) {
  if (num_levels_ == 0)
    throw std::invalid_argument("scheduler needs at least one level");
  if (time_quanta_.size() != num_levels_)
    throw std::invalid_argument("expected " + std::to_string(num_levels_) +
                                " time quanta, got " + std::to_string(time_quanta_.size()));
  tiers_.assign(num_levels_, {});
}

Scheduler::Scheduler(const Config& cfg) : Scheduler(cfg.levels, cfg.quanta) {
  if (cfg.boost_interval == 0)
    throw std::invalid_argument("boost interval must be positive");
  boost_interval_ = cfg.boost_interval;
  order_  = cfg.order;
  lowest_ = cfg.lowest;
}

// ------------------------------ Classification ------------------------------

void Scheduler::add_process(Process process) {
  if (process.priority >= num_levels_) process.priority = num_levels_ - 1;
  // nothing left to run: never held in a tier
  if (process.remaining_time == 0) {
    emit(TraceKind::Finish, process, process.priority, 0);
    return;
  }
  tiers_[process.priority].push_back(std::move(process));
}

// ------------------------------ Dispatch ------------------------------------

Process Scheduler::take_next(Tier& q) {
  Process p;
  if (order_ == DispatchOrder::Lifo) { p = std::move(q.back()); q.pop_back(); }
  else                               { p = std::move(q.front()); q.pop_front(); }
  return p;
}

void Scheduler::execute_process(std::size_t tier_index) {
  if (tier_index >= num_levels_)
    throw std::out_of_range("tier index " + std::to_string(tier_index) +
                            " out of range [0, " + std::to_string(num_levels_) + ")");
  Tier& q = tiers_[tier_index];
  if (q.empty()) return;

  Process p = take_next(q);
  std::uint32_t executed = std::min(p.remaining_time, time_quanta_[tier_index]);
  p.remaining_time      -= executed;
  p.total_executed_time += executed;
  current_time_         += executed;

  // place the record before tracing so a throwing sink cannot lose it
  Process seen = p;
  TraceKind outcome;
  std::size_t to = tier_index;
  if (p.remaining_time == 0) {
    outcome = TraceKind::Finish;
  } else if (tier_index + 1 < num_levels_) {
    outcome = TraceKind::Demote;
    to = tier_index + 1;
    p.priority = to;
    seen.priority = to;
    tiers_[to].push_back(std::move(p));
  } else if (lowest_ == LowestTierPolicy::Requeue) {
    outcome = TraceKind::Requeue;
    q.push_back(std::move(p));
  } else {
    // exhausted the lowest tier without finishing: no longer tracked
    outcome = TraceKind::Drop;
  }

  emit(TraceKind::Exec, seen, tier_index, executed);
  emit(outcome, seen, to, executed);
}

// ------------------------------ Boost & clock -------------------------------

void Scheduler::priority_boost() {
  std::size_t moved = 0;
  for (std::size_t lvl = 1; lvl < num_levels_; ++lvl) {
    Tier& q = tiers_[lvl];
    while (!q.empty()) {
      Process p = std::move(q.front());
      q.pop_front();
      p.priority = 0;
      tiers_[0].push_back(std::move(p));
      ++moved;
    }
  }
  if (trace_) {
    TraceEvent ev;
    ev.kind = TraceKind::Boost;
    ev.executed = static_cast<std::uint32_t>(moved);
    ev.time = current_time_;
    trace_(ev);
  }
}

void Scheduler::update_time(std::uint32_t elapsed) {
  current_time_ += elapsed;
  if (current_time_ % boost_interval_ == 0) priority_boost();
}

// ------------------------------ Queries -------------------------------------

bool Scheduler::empty() const {
  for (auto& q : tiers_) if (!q.empty()) return false;
  return true;
}

std::size_t Scheduler::size() const {
  std::size_t n = 0;
  for (auto& q : tiers_) n += q.size();
  return n;
}

void Scheduler::emit(TraceKind kind, const Process& p, std::size_t tier, std::uint32_t executed) {
  if (!trace_) return;
  TraceEvent ev;
  ev.kind = kind;
  ev.pid = p.id;
  ev.tier = tier;
  ev.executed = executed;
  ev.remaining = p.remaining_time;
  ev.time = current_time_;
  trace_(ev);
}

// ------------------------------ Driver loop ---------------------------------

std::size_t run_until_idle(Scheduler& sched) {
  std::size_t dispatches = 0;
  std::size_t stalled = 0;
  while (!sched.empty()) {
    std::size_t lvl = 0;
    while (sched.tier(lvl).empty()) ++lvl;

    std::uint32_t t = sched.current_time();
    std::size_t   n = sched.size();
    sched.execute_process(lvl);
    ++dispatches;

    // zero quanta can leave work that never shrinks
    if (sched.current_time() != t || sched.size() < n) stalled = 0;
    else if (++stalled > (sched.num_levels() + 1) * (sched.size() + 1))
      throw std::runtime_error("scheduler makes no progress; check for zero quanta");

    sched.update_time(0);
  }
  return dispatches;
}

// ------------------------------ Debug dump ----------------------------------

std::ostream& operator<<(std::ostream& os, const Process& p) {
  return os << "Process { id: " << p.id
            << ", priority: " << p.priority
            << ", remaining_time: " << p.remaining_time
            << ", total_executed_time: " << p.total_executed_time << " }";
}

void dump_tiers(std::ostream& os, const Scheduler& sched) {
  for (std::size_t i = 0; i < sched.num_levels(); ++i) {
    os << "Queue " << i << ": [";
    const char* sep = "";
    for (auto& p : sched.tier(i)) { os << sep << p; sep = ", "; }
    os << "]\n";
  }
}

} // namespace mlfq_sim
