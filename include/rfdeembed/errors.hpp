#pragma once

#include <stdexcept>
#include <string>

namespace rfdeembed {

/// Invalid construction input: mismatched or empty dummy structures, bad
/// option values, wrong port count.
class ConfigError : public std::invalid_argument {
public:
  explicit ConfigError(const std::string &what) : std::invalid_argument(what) {}
};

/// The measured network is not sampled on the grid the strategy was built for.
class FrequencyMismatch : public std::runtime_error {
public:
  explicit FrequencyMismatch(const std::string &what)
      : std::runtime_error(what) {}
};

/// An input/option combination the algorithm does not implement.
class UnsupportedCombination : public std::runtime_error {
public:
  explicit UnsupportedCombination(const std::string &what)
      : std::runtime_error(what) {}
};

/// An iterative solver ran out of iterations before meeting its tolerance.
class NonConvergence : public std::runtime_error {
public:
  explicit NonConvergence(const std::string &what) : std::runtime_error(what) {}
};

} // namespace rfdeembed
