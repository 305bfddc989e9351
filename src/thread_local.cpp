#include "simrng/thread_local.hpp"

#include <atomic>

#include "simrng/log.hpp"

namespace simrng {

static std::atomic<uint64_t> g_next_ordinal{0};

static uint64_t splitmix64(uint64_t& x) noexcept {
  uint64_t z = (x += 0x9e3779b97f4a7c15ull);
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ull;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebull;
  return z ^ (z >> 31);
}

SeedPair thread_stream_seeds(uint64_t ordinal) noexcept {
  uint64_t sm = static_cast<uint64_t>(kDefaultSeeds.second) ^ ordinal;
  const uint64_t s = splitmix64(sm);

  SeedPair out = kDefaultSeeds;
  const uint32_t folded = static_cast<uint32_t>(s ^ (s >> 32));
  if (folded != 0u) out.second = folded;
  return out;
}

uint64_t thread_ordinal() {
  thread_local const uint64_t ordinal = g_next_ordinal.fetch_add(1, std::memory_order_relaxed);
  return ordinal;
}

static Generator make_thread_generator() {
  const uint64_t ord = thread_ordinal();
  Generator g{thread_stream_seeds(ord)};
  SIMRNG_LOG_DEBUG("thread generator #{} created with seeds ({}, {})",
                   ord, g.seeds().first, g.seeds().second);
  return g;
}

Generator& thread_local_instance() {
  thread_local Generator instance = make_thread_generator();
  return instance;
}

} // namespace simrng
