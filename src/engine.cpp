#include "simrng/engine.hpp"

#include <cmath>

#include <spdlog/fmt/fmt.h>

#include "simrng/errors.hpp"
#include "simrng/log.hpp"

namespace simrng {

// 1 / (2^32 + 2): maps u+1 in [1, 2^32] strictly inside (0,1)
static constexpr double kOpenScale = 2.328306435454494e-10;

uint32_t Engine::next_u32() noexcept {
  SeedPair& s = state_.words_mut();
  s.second = 36969u * (s.second & 0xFFFFu) + (s.second >> 16);
  s.first  = 18000u * (s.first & 0xFFFFu) + (s.first >> 16);
  return (s.second << 16) + s.first;
}

double Engine::uniform01() noexcept {
  return (static_cast<double>(next_u32()) + 1.0) * kOpenScale;
}

double Engine::uniform(double min, double max) {
  if (!std::isfinite(min) || !std::isfinite(max) || !(min < max)) {
    SIMRNG_LOG_DEBUG("uniform: rejecting range [{}, {}]", min, max);
    throw InvalidDistributionParameter(
        fmt::format("uniform: need finite min < max, got [{}, {}]", min, max));
  }
  const double r = min + uniform01() * (max - min);
  if (!std::isfinite(r)) {
    throw NumericDomainError(fmt::format("uniform: range [{}, {}] overflows", min, max));
  }
  return r;
}

void Engine::set_seeds(const SeedInput& in) {
  state_.apply(in, clock_);
  spare_normal_.reset();
}

} // namespace simrng
