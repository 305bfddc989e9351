#pragma once
#include <span>
#include <vector>

#include "simrng/engine.hpp"

// Samplers built on Engine draws. Every function validates its parameters
// before touching the engine: a rejected call (InvalidDistributionParameter)
// leaves the sequence exactly where it was. A non-finite result raises
// NumericDomainError instead of being clamped.
namespace simrng::dist {

// Box-Muller; the sin deviate of each pair is cached on the engine and
// returned by the following call.
double normal(Engine& eng, double mean = 0.0, double stddev = 1.0);

// Inverse CDF: -mean * ln(U)
double exponential(Engine& eng, double mean = 1.0);

// lower < upper, lower <= mode <= upper. Result in [lower, upper].
double triangular(Engine& eng, double lower, double mode, double upper);

// Marsaglia-Tsang for shape >= 1; shape < 1 is boosted through
// gamma(shape + 1) * U^(1/shape).
double gamma(Engine& eng, double shape, double scale);

double inverse_gamma(Engine& eng, double shape, double scale);

double beta(Engine& eng, double a, double b);

// gamma(df / 2, 2)
double chi_square(Engine& eng, double df);

double weibull(Engine& eng, double shape, double scale);

// One gamma(alpha_i, 1) per parameter, normalised to sum 1.
std::vector<double> dirichlet(Engine& eng, std::span<const double> alphas);

// Inverse CDF with a single uniform; symmetric around mean.
double laplace(Engine& eng, double mean, double scale);

double cauchy(Engine& eng, double median, double scale);

double student_t(Engine& eng, double df);

// exp(normal(mu, sigma))
double log_normal(Engine& eng, double mu, double sigma);

} // namespace simrng::dist
