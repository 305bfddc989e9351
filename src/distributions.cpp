#include "simrng/distributions.hpp"

#include <cmath>
#include <numbers>
#include <string>

#include <spdlog/fmt/fmt.h>

#include "simrng/errors.hpp"
#include "simrng/log.hpp"

namespace simrng::dist {

[[noreturn]] static void reject(const char* op, const std::string& why) {
  SIMRNG_LOG_DEBUG("{}: rejected ({})", op, why);
  throw InvalidDistributionParameter(fmt::format("{}: {}", op, why));
}

static void require_positive(const char* op, const char* name, double v) {
  if (!(v > 0.0) || !std::isfinite(v)) reject(op, fmt::format("{} must be positive and finite, got {}", name, v));
}

static void require_finite(const char* op, const char* name, double v) {
  if (!std::isfinite(v)) reject(op, fmt::format("{} must be finite, got {}", name, v));
}

static double checked(const char* op, double v) {
  if (!std::isfinite(v)) {
    throw NumericDomainError(fmt::format("{}: sample is not finite ({})", op, v));
  }
  return v;
}

static double standard_normal(Engine& eng) {
  if (auto spare = eng.take_spare_normal()) return *spare;

  const double u1 = eng.uniform01();
  const double u2 = eng.uniform01();
  const double r = std::sqrt(-2.0 * std::log(u1));
  const double theta = 2.0 * std::numbers::pi * u2;

  eng.store_spare_normal(r * std::sin(theta));
  return r * std::cos(theta);
}

// Unit-scale gamma; shape already validated.
static double standard_gamma(Engine& eng, double shape) {
  if (shape < 1.0) {
    const double g = standard_gamma(eng, shape + 1.0);
    const double w = eng.uniform01();
    return g * std::pow(w, 1.0 / shape);
  }

  const double d = shape - 1.0 / 3.0;
  const double c = 1.0 / std::sqrt(9.0 * d);

  for (;;) {
    double x = 0.0;
    double v = 0.0;
    do {
      x = standard_normal(eng);
      v = 1.0 + c * x;
    } while (v <= 0.0);

    v = v * v * v;
    const double u = eng.uniform01();
    const double x2 = x * x;

    // squeeze, then the exact log test
    if (u < 1.0 - 0.0331 * x2 * x2) return d * v;
    if (std::log(u) < 0.5 * x2 + d * (1.0 - v + std::log(v))) return d * v;
  }
}

double normal(Engine& eng, double mean, double stddev) {
  require_finite("normal", "mean", mean);
  require_positive("normal", "stddev", stddev);
  return checked("normal", mean + stddev * standard_normal(eng));
}

double exponential(Engine& eng, double mean) {
  require_positive("exponential", "mean", mean);
  return checked("exponential", -mean * std::log(eng.uniform01()));
}

double triangular(Engine& eng, double lower, double mode, double upper) {
  require_finite("triangular", "lower", lower);
  require_finite("triangular", "mode", mode);
  require_finite("triangular", "upper", upper);
  if (!(lower < upper)) reject("triangular", fmt::format("need lower < upper, got [{}, {}]", lower, upper));
  if (mode < lower || mode > upper) {
    reject("triangular", fmt::format("mode {} outside [{}, {}]", mode, lower, upper));
  }

  const double width = upper - lower;
  if (!std::isfinite(width)) {
    throw NumericDomainError(fmt::format("triangular: range [{}, {}] overflows", lower, upper));
  }
  const double f_mode = (mode - lower) / width;
  const double u = eng.uniform01();

  // split square roots keep the products finite for wide finite ranges
  if (u < f_mode) return checked("triangular", lower + std::sqrt(u * width) * std::sqrt(mode - lower));
  return checked("triangular", upper - std::sqrt((1.0 - u) * width) * std::sqrt(upper - mode));
}

double gamma(Engine& eng, double shape, double scale) {
  require_positive("gamma", "shape", shape);
  require_positive("gamma", "scale", scale);
  return checked("gamma", scale * standard_gamma(eng, shape));
}

double inverse_gamma(Engine& eng, double shape, double scale) {
  require_positive("inverse_gamma", "shape", shape);
  require_positive("inverse_gamma", "scale", scale);
  return checked("inverse_gamma", scale / standard_gamma(eng, shape));
}

double beta(Engine& eng, double a, double b) {
  require_positive("beta", "a", a);
  require_positive("beta", "b", b);
  const double u = standard_gamma(eng, a);
  const double v = standard_gamma(eng, b);
  return checked("beta", u / (u + v));
}

double chi_square(Engine& eng, double df) {
  require_positive("chi_square", "df", df);
  return checked("chi_square", 2.0 * standard_gamma(eng, 0.5 * df));
}

double weibull(Engine& eng, double shape, double scale) {
  require_positive("weibull", "shape", shape);
  require_positive("weibull", "scale", scale);
  return checked("weibull", scale * std::pow(-std::log(eng.uniform01()), 1.0 / shape));
}

std::vector<double> dirichlet(Engine& eng, std::span<const double> alphas) {
  if (alphas.empty()) reject("dirichlet", "need at least one alpha");
  for (const double a : alphas) require_positive("dirichlet", "alpha", a);

  std::vector<double> out;
  out.reserve(alphas.size());
  double sum = 0.0;
  for (const double a : alphas) {
    out.push_back(standard_gamma(eng, a));
    sum += out.back();
  }

  if (!(sum > 0.0) || !std::isfinite(sum)) {
    throw NumericDomainError(fmt::format("dirichlet: cannot normalise gamma sum {}", sum));
  }
  for (double& x : out) x /= sum;
  return out;
}

double laplace(Engine& eng, double mean, double scale) {
  require_finite("laplace", "mean", mean);
  require_positive("laplace", "scale", scale);

  const double u = eng.uniform01();
  if (u < 0.5) return checked("laplace", mean + scale * std::log(2.0 * u));
  return checked("laplace", mean - scale * std::log(2.0 * (1.0 - u)));
}

double cauchy(Engine& eng, double median, double scale) {
  require_finite("cauchy", "median", median);
  require_positive("cauchy", "scale", scale);
  const double p = eng.uniform01();
  return checked("cauchy", median + scale * std::tan(std::numbers::pi * (p - 0.5)));
}

double student_t(Engine& eng, double df) {
  require_positive("student_t", "df", df);
  const double y1 = standard_normal(eng);
  const double y2 = 2.0 * standard_gamma(eng, 0.5 * df);
  return checked("student_t", y1 / std::sqrt(y2 / df));
}

double log_normal(Engine& eng, double mu, double sigma) {
  require_finite("log_normal", "mu", mu);
  require_positive("log_normal", "sigma", sigma);
  return checked("log_normal", std::exp(mu + sigma * standard_normal(eng)));
}

} // namespace simrng::dist
