#include "mlfq_sim/config.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <utility>

namespace mlfq_sim {

namespace {

// Strict non-negative integer parse; rejects signs, blanks and trailing junk.
std::optional<unsigned long> parse_uint(const std::string& s) {
  if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) return std::nullopt;
  errno = 0;
  unsigned long v = std::strtoul(s.c_str(), nullptr, 10);
  if (errno == ERANGE || v > 0xFFFFFFFFul) return std::nullopt;
  return v;
}

std::string trim(const std::string& s) {
  auto b = s.find_first_not_of(" \t");
  if (b == std::string::npos) return "";
  auto e = s.find_last_not_of(" \t");
  return s.substr(b, e - b + 1);
}

} // namespace

std::optional<DispatchOrder> parse_order(const std::string& s) {
  if (s == "lifo") return DispatchOrder::Lifo;
  if (s == "fifo") return DispatchOrder::Fifo;
  return std::nullopt;
}

std::optional<LowestTierPolicy> parse_lowest_policy(const std::string& s) {
  if (s == "drop") return LowestTierPolicy::Drop;
  if (s == "requeue") return LowestTierPolicy::Requeue;
  return std::nullopt;
}

std::optional<std::vector<std::uint32_t>> parse_quanta(const std::string& s) {
  std::vector<std::uint32_t> out;
  std::istringstream in(s);
  std::string item;
  while (std::getline(in, item, ',')) {
    auto v = parse_uint(trim(item));
    if (!v) return std::nullopt;
    out.push_back(static_cast<std::uint32_t>(*v));
  }
  if (out.empty()) return std::nullopt;
  return out;
}

std::vector<std::uint32_t> default_quanta(std::size_t levels) {
  levels = std::clamp<std::size_t>(levels, 1, kMaxLevels);
  std::vector<std::uint32_t> q;
  for (std::size_t i = 0; i < levels; ++i) q.push_back(2u << i);
  return q;
}

const char* to_string(DispatchOrder o) {
  return o == DispatchOrder::Lifo ? "lifo" : "fifo";
}

const char* to_string(LowestTierPolicy p) {
  return p == LowestTierPolicy::Drop ? "drop" : "requeue";
}

Config config_from_env(Config base) {
  Config cfg = std::move(base);
  cfg.levels = std::clamp<std::size_t>(cfg.levels, 1, kMaxLevels);
  if (cfg.quanta.size() > static_cast<std::size_t>(kMaxLevels)) cfg.quanta.resize(kMaxLevels);

  if (const char* s = std::getenv("MLFQ_LEVELS")) {
    if (auto v = parse_uint(s))
      cfg.levels = static_cast<std::size_t>(std::clamp<unsigned long>(*v, 1, kMaxLevels));
  }
  if (const char* s = std::getenv("MLFQ_QUANTA")) {
    if (auto q = parse_quanta(s)) {
      cfg.quanta = *q;
      if (cfg.quanta.size() > static_cast<std::size_t>(kMaxLevels)) cfg.quanta.resize(kMaxLevels);
      if (!std::getenv("MLFQ_LEVELS"))
        cfg.levels = std::min<std::size_t>(cfg.quanta.size(), kMaxLevels);
    }
  }
  // keep the table in step with the level count
  if (cfg.quanta.size() != cfg.levels) cfg.quanta = default_quanta(cfg.levels);

  if (const char* s = std::getenv("MLFQ_ORDER")) {
    if (auto o = parse_order(s)) cfg.order = *o;
  }
  if (const char* s = std::getenv("MLFQ_LOWEST")) {
    if (auto p = parse_lowest_policy(s)) cfg.lowest = *p;
  }
  if (const char* s = std::getenv("MLFQ_BOOST")) {
    auto v = parse_uint(s);
    if (v && *v > 0) cfg.boost_interval = static_cast<std::uint32_t>(*v);
  }
  if (const char* s = std::getenv("MLFQ_LOG")) {
    if (*s) cfg.log_path = s;
  }
  return cfg;
}

} // namespace mlfq_sim
