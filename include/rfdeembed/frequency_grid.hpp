#pragma once

#include <complex>
#include <vector>

#include "rfdeembed/network.hpp"

namespace rfdeembed {

/// True if the first sample is exactly 0 Hz.
bool has_dc_point(const std::vector<double> &freq);

/// True if the grid is `k * df` for k = 1..n, i.e. evenly spaced with the
/// first point one step above DC. Both checks use an absolute tolerance.
/// @param tol Allowed deviation in Hz
bool is_uniform(const std::vector<double> &freq, double tol = 0.1);

/// Uniform grid covering the same span as `freq`, stepping by its first
/// sample. Falls back to `max_points` evenly spaced samples when that would
/// exceed the cap.
/// @throws std::invalid_argument if the grid is empty or starts at DC
std::vector<double> uniform_grid_for(const std::vector<double> &freq,
                                     size_t max_points = 10000);

/// Copy of `net` without its first (DC) sample.
/// @throws std::invalid_argument if the network has no DC point
Network strip_dc(const Network &net);

/// Piecewise-linear interpolation with linear extrapolation beyond the ends.
std::vector<std::complex<double>>
interp_linear(const std::vector<double> &x,
              const std::vector<std::complex<double>> &y,
              const std::vector<double> &xq);

/// Natural cubic spline through (x, y) evaluated at `xq`.
/// `x` must be strictly increasing and contain at least 3 points.
double natural_spline_eval(const std::vector<double> &x,
                           const std::vector<double> &y, double xq);

} // namespace rfdeembed
