#include "mlfq_sim/trace.hpp"

#include <sstream>

namespace mlfq_sim {

const char* event_name(TraceKind kind) {
  switch (kind) {
    case TraceKind::Exec:    return "exec";
    case TraceKind::Demote:  return "demote";
    case TraceKind::Finish:  return "finish";
    case TraceKind::Drop:    return "drop";
    case TraceKind::Requeue: return "requeue";
    case TraceKind::Boost:   return "boost";
  }
  return "unknown";
}

std::string format_exec(const TraceEvent& ev) {
  std::ostringstream os;
  os << "Executed Process ID: " << ev.pid
     << ", Time Executed: " << ev.executed
     << ", Time Remaining: " << ev.remaining;
  return os.str();
}

// ------------------------------ Logger --------------------------------------

Logger::Logger(const std::string& path) {
  file_.open(path, std::ios::out | std::ios::trunc);
  if (file_.is_open()) { out_ = &file_; header(); }
}

Logger::Logger(std::ostream& out) : out_(&out) { header(); }

void Logger::header() { *out_ << "time,event,pid,info\n"; }

void Logger::log(std::uint32_t time, const char* event, long pid, const std::string& info) {
  if (!out_) return;
  *out_ << time << "," << event << "," << pid << "," << info << "\n";
  ++rows_;
}

void Logger::log(const TraceEvent& ev) {
  std::ostringstream info;
  switch (ev.kind) {
    case TraceKind::Exec:
      info << "tier=" << ev.tier << " ran=" << ev.executed << " left=" << ev.remaining;
      break;
    case TraceKind::Demote:
      info << "to=" << ev.tier;
      break;
    case TraceKind::Boost:
      log(ev.time, event_name(ev.kind), -1, "moved=" + std::to_string(ev.executed));
      return;
    default:
      info << "tier=" << ev.tier;
      break;
  }
  log(ev.time, event_name(ev.kind), static_cast<long>(ev.pid), info.str());
}

TraceFunc Logger::sink() {
  return [this](const TraceEvent& ev) { log(ev); };
}

} // namespace mlfq_sim
