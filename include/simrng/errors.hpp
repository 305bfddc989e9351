#pragma once
#include <stdexcept>
#include <string>

namespace simrng {

// Negative seed value (or a timestamp before the epoch).
class InvalidSeedArgument : public std::invalid_argument {
public:
  explicit InvalidSeedArgument(const std::string& what) : std::invalid_argument(what) {}
};

// Out-of-domain distribution parameter. Thrown before the engine advances.
class InvalidDistributionParameter : public std::domain_error {
public:
  explicit InvalidDistributionParameter(const std::string& what) : std::domain_error(what) {}
};

// A sample that overflowed or came out NaN.
class NumericDomainError : public std::range_error {
public:
  explicit NumericDomainError(const std::string& what) : std::range_error(what) {}
};

} // namespace simrng
