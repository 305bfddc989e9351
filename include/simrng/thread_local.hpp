#pragma once
#include <cstdint>

#include "simrng/generator.hpp"
#include "simrng/types.hpp"

namespace simrng {

// The calling thread's private generator. Built on the thread's first call,
// seeded with thread_stream_seeds(thread_ordinal()), destroyed at thread exit.
// Same thread => same object; no state is shared between threads, so no lock.
Generator& thread_local_instance();

// Process-wide ordinal of the calling thread, assigned on first call (0, 1, ...).
uint64_t thread_ordinal();

// Default first word; second word mixed from the ordinal with SplitMix64.
SeedPair thread_stream_seeds(uint64_t ordinal) noexcept;

} // namespace simrng
