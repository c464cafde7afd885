#ifndef MLFQ_SIM_TRACE_HPP
#define MLFQ_SIM_TRACE_HPP

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <functional>
#include <ostream>
#include <string>

namespace mlfq_sim {

enum class TraceKind { Exec, Demote, Finish, Drop, Requeue, Boost };

// One scheduling event. For Boost, pid is unused and `executed` holds the
// number of processes moved to tier 0.
struct TraceEvent {
  TraceKind     kind = TraceKind::Exec;
  std::uint32_t pid = 0;
  std::size_t   tier = 0;
  std::uint32_t executed = 0;
  std::uint32_t remaining = 0;
  std::uint32_t time = 0;
};

using TraceFunc = std::function<void(const TraceEvent&)>;

const char* event_name(TraceKind kind);

// "Executed Process ID: 1, Time Executed: 2, Time Remaining: 8"
std::string format_exec(const TraceEvent& ev);

// CSV event log: "time,event,pid,info", one row per event.
class Logger {
public:
  explicit Logger(const std::string& path);
  explicit Logger(std::ostream& out);

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  bool is_open() const { return out_ != nullptr; }
  std::size_t rows() const { return rows_; }

  void log(std::uint32_t time, const char* event, long pid, const std::string& info = "");
  void log(const TraceEvent& ev);

  // Adapter for Scheduler::set_trace. The Logger must outlive the sink.
  TraceFunc sink();

private:
  void header();

  std::ofstream file_;
  std::ostream* out_ = nullptr;
  std::size_t   rows_ = 0;
};

} // namespace mlfq_sim

#endif // MLFQ_SIM_TRACE_HPP
