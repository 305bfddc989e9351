#pragma once
#include <cstdint>
#include <initializer_list>
#include <span>
#include <utility>
#include <vector>

#include "simrng/distributions.hpp"
#include "simrng/engine.hpp"
#include "simrng/seed.hpp"
#include "simrng/types.hpp"

namespace simrng {

// Engine plus the distribution samplers, as one value type.
class Generator {
public:
  Generator() = default;
  explicit Generator(SeedPair seeds, Clock clock = system_clock_now)
    : eng_(seeds, std::move(clock)) {}
  Generator(int64_t first, int64_t second) : eng_(first, second) {}

  const SeedPair& seeds() const noexcept { return eng_.seeds(); }

  void set_seeds(const SeedInput& in) { eng_.set_seeds(in); }
  void set_seeds() { eng_.set_seeds(UseClock{}); }
  void set_seeds(int64_t first, int64_t second) { eng_.set_seeds(SeedValues{first, second}); }

  // Replaces the second word only.
  void set_seed(int64_t value) { eng_.set_seeds(SingleSeed{value}); }

  void set_clock(Clock c) { eng_.set_clock(std::move(c)); }

  uint32_t next_u32() noexcept { return eng_.next_u32(); }
  double uniform(double min = 0.0, double max = 1.0) { return eng_.uniform(min, max); }

  double normal(double mean = 0.0, double stddev = 1.0) { return dist::normal(eng_, mean, stddev); }
  double exponential(double mean = 1.0) { return dist::exponential(eng_, mean); }
  double triangular(double lower, double mode, double upper) {
    return dist::triangular(eng_, lower, mode, upper);
  }
  double gamma(double shape, double scale) { return dist::gamma(eng_, shape, scale); }
  double inverse_gamma(double shape, double scale) { return dist::inverse_gamma(eng_, shape, scale); }
  double beta(double a, double b) { return dist::beta(eng_, a, b); }
  double chi_square(double df) { return dist::chi_square(eng_, df); }
  double weibull(double shape, double scale) { return dist::weibull(eng_, shape, scale); }
  std::vector<double> dirichlet(std::span<const double> alphas) { return dist::dirichlet(eng_, alphas); }
  std::vector<double> dirichlet(std::initializer_list<double> alphas) {
    return dist::dirichlet(eng_, std::span<const double>(alphas.begin(), alphas.size()));
  }
  double laplace(double mean, double scale) { return dist::laplace(eng_, mean, scale); }
  double cauchy(double median, double scale) { return dist::cauchy(eng_, median, scale); }
  double student_t(double df) { return dist::student_t(eng_, df); }
  double log_normal(double mu, double sigma) { return dist::log_normal(eng_, mu, sigma); }

  Engine& engine_mut() noexcept { return eng_; }
  const Engine& engine() const noexcept { return eng_; }

private:
  Engine eng_{};
};

} // namespace simrng
