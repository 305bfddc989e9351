#pragma once
#include <cstdint>
#include <variant>

#include "simrng/types.hpp"

namespace simrng {

// Seed inputs accepted by set_seeds().
struct UseClock {};                                 // no value: derive from clock()
struct SingleSeed { int64_t value{}; };             // replaces the second word only
struct SeedValues { int64_t first{}; int64_t second{}; };

using SeedInput = std::variant<UseClock, SingleSeed, SeedValues, Timestamp>;

class SeedState {
public:
  SeedState() = default;
  // A zero word in `words` keeps the default value, as in apply().
  explicit SeedState(SeedPair words) noexcept;

  // Throws InvalidSeedArgument if either value is negative.
  SeedState(int64_t first, int64_t second);

  const SeedPair& words() const noexcept { return words_; }
  SeedPair& words_mut() noexcept { return words_; }

  // Replaces the words as described by `in`. Values wrap modulo 2^32 and a
  // derived zero word keeps its prior value (zero is a fixed point of the
  // MWC step). Validation happens first: on throw the state is unchanged.
  void apply(const SeedInput& in, const Clock& clock);

  // Microseconds since the epoch, x: first = (x >> 16) mod 2^32, second = x mod 2^32.
  static SeedPair from_timestamp(Timestamp ts);

private:
  SeedPair words_{kDefaultSeeds};
};

} // namespace simrng
