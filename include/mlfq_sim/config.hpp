#ifndef MLFQ_SIM_CONFIG_HPP
#define MLFQ_SIM_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mlfq_sim {

// Which end of a tier the next process is taken from.
enum class DispatchOrder { Lifo, Fifo };

// What happens to a process that exhausts its quantum in the lowest tier.
enum class LowestTierPolicy { Drop, Requeue };

constexpr std::uint32_t kDefaultBoostInterval = 100;
constexpr int kMaxLevels = 8;

struct Config {
  std::size_t                levels = 3;
  std::vector<std::uint32_t> quanta = {2, 4, 8};
  DispatchOrder              order  = DispatchOrder::Lifo;
  LowestTierPolicy           lowest = LowestTierPolicy::Drop;
  std::uint32_t              boost_interval = kDefaultBoostInterval;
  std::string                log_path = "mlfq_trace.csv";
};

// Overlay MLFQ_LEVELS, MLFQ_QUANTA, MLFQ_ORDER, MLFQ_LOWEST, MLFQ_BOOST and
// MLFQ_LOG on top of `base`. Unknown values keep the base setting. Levels are
// clamped to [1, kMaxLevels] and longer quantum tables are cut to fit.
Config config_from_env(Config base = Config{});

// Parse "lifo"/"fifo" and "drop"/"requeue"; nullopt for anything else.
std::optional<DispatchOrder>    parse_order(const std::string& s);
std::optional<LowestTierPolicy> parse_lowest_policy(const std::string& s);

// Parse a comma separated list of non-negative integers ("2,4,8").
std::optional<std::vector<std::uint32_t>> parse_quanta(const std::string& s);

// Default quantum table for `levels` tiers: 2, 4, 8, ... The level count is
// clamped to [1, kMaxLevels].
std::vector<std::uint32_t> default_quanta(std::size_t levels);

const char* to_string(DispatchOrder o);
const char* to_string(LowestTierPolicy p);

} // namespace mlfq_sim

#endif // MLFQ_SIM_CONFIG_HPP
