#pragma once
#include <cstdint>
#include <optional>
#include <utility>

#include "simrng/seed.hpp"
#include "simrng/types.hpp"

namespace simrng {

// Reproducible two-word multiply-with-carry generator (Marsaglia).
// Identical seeds + identical call sequence => identical output.
// Not thread-safe: one instance per thread (see thread_local_instance()).
class Engine {
public:
  Engine() = default;
  explicit Engine(SeedPair seeds, Clock clock = system_clock_now)
    : state_(seeds), clock_(std::move(clock)) {}

  // Throws InvalidSeedArgument on negative values.
  Engine(int64_t first, int64_t second) : state_(first, second) {}

  // Raw 32-bit draw; advances both words by one step.
  uint32_t next_u32() noexcept;

  // Uniform on the open interval (0,1): (u + 1) / (2^32 + 2)
  double uniform01() noexcept;

  // min + uniform01() * (max - min); requires finite min < max
  double uniform(double min = 0.0, double max = 1.0);

  const SeedPair& seeds() const noexcept { return state_.words(); }

  // Replaces the seed words and drops the cached normal deviate.
  void set_seeds(const SeedInput& in);

  const Clock& clock() const noexcept { return clock_; }
  void set_clock(Clock c) { clock_ = std::move(c); }

  // Second deviate of the last Box-Muller pair, consumed on read.
  std::optional<double> take_spare_normal() noexcept { return std::exchange(spare_normal_, std::nullopt); }
  void store_spare_normal(double v) noexcept { spare_normal_ = v; }

private:
  SeedState state_{};
  Clock clock_{system_clock_now};
  std::optional<double> spare_normal_{};
};

} // namespace simrng
