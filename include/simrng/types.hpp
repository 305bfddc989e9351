#pragma once
#include <chrono>
#include <cstdint>
#include <functional>

namespace simrng {

// Two-word state of the multiply-with-carry generator.
// first = "w" word (multiplier 18000), second = "z" word (multiplier 36969)
struct SeedPair {
  uint32_t first{};
  uint32_t second{};

  friend bool operator==(const SeedPair&, const SeedPair&) = default;
};

inline constexpr SeedPair kDefaultSeeds{521288629u, 362436069u};

using Timestamp = std::chrono::system_clock::time_point;

// Source of "now" for clock-derived seeds. Tests freeze it.
using Clock = std::function<Timestamp()>;

inline Timestamp system_clock_now() { return std::chrono::system_clock::now(); }

} // namespace simrng
