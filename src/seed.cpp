#include "simrng/seed.hpp"

#include <chrono>
#include <string>
#include <type_traits>

#include "simrng/errors.hpp"
#include "simrng/log.hpp"

namespace simrng {

static uint32_t to_word(int64_t v, const char* what) {
  if (v < 0) {
    SIMRNG_LOG_DEBUG("rejecting negative seed {}={}", what, v);
    throw InvalidSeedArgument(std::string("seed ") + what + " must be non-negative, got " +
                              std::to_string(v));
  }
  return static_cast<uint32_t>(static_cast<uint64_t>(v) & 0xFFFFFFFFull);
}

static void assign_nonzero(uint32_t& word, uint32_t v) noexcept {
  if (v != 0u) word = v;
}

SeedState::SeedState(SeedPair words) noexcept {
  assign_nonzero(words_.first, words.first);
  assign_nonzero(words_.second, words.second);
}

SeedState::SeedState(int64_t first, int64_t second) {
  const uint32_t w = to_word(first, "first");
  const uint32_t z = to_word(second, "second");
  assign_nonzero(words_.first, w);
  assign_nonzero(words_.second, z);
}

SeedPair SeedState::from_timestamp(Timestamp ts) {
  using namespace std::chrono;
  const int64_t us = duration_cast<microseconds>(ts.time_since_epoch()).count();
  if (us < 0) {
    throw InvalidSeedArgument("timestamp seed must not precede the epoch, got " +
                              std::to_string(us) + "us");
  }
  const uint64_t x = static_cast<uint64_t>(us);
  return SeedPair{static_cast<uint32_t>((x >> 16) & 0xFFFFFFFFull),
                  static_cast<uint32_t>(x & 0xFFFFFFFFull)};
}

void SeedState::apply(const SeedInput& in, const Clock& clock) {
  SeedPair next = words_;

  std::visit(
      [&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, SingleSeed>) {
          assign_nonzero(next.second, to_word(v.value, "value"));
        } else if constexpr (std::is_same_v<T, SeedValues>) {
          const uint32_t w = to_word(v.first, "first");
          const uint32_t z = to_word(v.second, "second");
          assign_nonzero(next.first, w);
          assign_nonzero(next.second, z);
        } else {
          SeedPair derived{};
          if constexpr (std::is_same_v<T, Timestamp>) {
            derived = from_timestamp(v);
          } else {
            derived = from_timestamp(clock ? clock() : system_clock_now());
          }
          assign_nonzero(next.first, derived.first);
          assign_nonzero(next.second, derived.second);
        }
      },
      in);

  words_ = next;
  SIMRNG_LOG_DEBUG("seeds set to ({}, {})", words_.first, words_.second);
}

} // namespace simrng
