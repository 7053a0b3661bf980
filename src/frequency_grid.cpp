#include "rfdeembed/frequency_grid.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace rfdeembed {

bool has_dc_point(const std::vector<double> &freq) {
  return !freq.empty() && freq.front() == 0.0;
}

bool is_uniform(const std::vector<double> &freq, double tol) {
  if (freq.size() < 2)
    return false;
  const double df = freq[1] - freq[0];
  if (std::abs(freq[0] - df) > tol)
    return false;
  for (size_t i = 1; i < freq.size(); ++i) {
    if (std::abs(freq[i] - freq[i - 1] - df) > tol)
      return false;
  }
  return true;
}

std::vector<double> uniform_grid_for(const std::vector<double> &freq,
                                     size_t max_points) {
  if (freq.empty()) {
    throw std::invalid_argument("uniform_grid_for: empty frequency grid");
  }
  if (freq.front() <= 0.0) {
    throw std::invalid_argument(
        "uniform_grid_for: grid must start above DC");
  }
  const double fend = freq.back();
  const double projected = std::round(fend / freq.front());
  double step = freq.front();
  size_t n = static_cast<size_t>(projected);
  if (projected >= static_cast<double>(max_points)) {
    step = fend / static_cast<double>(max_points);
    n = max_points;
  }
  std::vector<double> out(n);
  for (size_t i = 0; i < n; ++i)
    out[i] = step * static_cast<double>(i + 1);
  return out;
}

Network strip_dc(const Network &net) {
  if (!has_dc_point(net.freq)) {
    throw std::invalid_argument("strip_dc: network has no DC point");
  }
  Network out;
  out.freq.assign(net.freq.begin() + 1, net.freq.end());
  out.s.assign(net.s.begin() + 1, net.s.end());
  out.z0 = net.z0;
  out.name = net.name;
  return out;
}

std::vector<std::complex<double>>
interp_linear(const std::vector<double> &x,
              const std::vector<std::complex<double>> &y,
              const std::vector<double> &xq) {
  if (x.size() != y.size() || x.empty()) {
    throw std::invalid_argument("interp_linear: invalid source data");
  }
  std::vector<std::complex<double>> out(xq.size());
  if (x.size() == 1) {
    std::fill(out.begin(), out.end(), y.front());
    return out;
  }
  const size_t last = x.size() - 2;
  for (size_t d = 0; d < xq.size(); ++d) {
    // Segment [s, s+1] containing xq[d]; end segments extrapolate.
    auto it = std::upper_bound(x.begin(), x.end(), xq[d]);
    size_t s = it == x.begin() ? 0 : static_cast<size_t>(it - x.begin()) - 1;
    s = std::min(s, last);
    const double alpha = (xq[d] - x[s]) / (x[s + 1] - x[s]);
    out[d] = y[s] + alpha * (y[s + 1] - y[s]);
  }
  return out;
}

double natural_spline_eval(const std::vector<double> &x,
                           const std::vector<double> &y, double xq) {
  const size_t n = x.size();
  if (n < 3 || y.size() != n) {
    throw std::invalid_argument(
        "natural_spline_eval: need at least 3 matching samples");
  }

  // Second derivatives by tridiagonal elimination, zero at both ends.
  std::vector<double> d2(n, 0.0), u(n, 0.0);
  for (size_t i = 1; i + 1 < n; ++i) {
    const double sig = (x[i] - x[i - 1]) / (x[i + 1] - x[i - 1]);
    const double p = sig * d2[i - 1] + 2.0;
    d2[i] = (sig - 1.0) / p;
    u[i] = (y[i + 1] - y[i]) / (x[i + 1] - x[i]) -
           (y[i] - y[i - 1]) / (x[i] - x[i - 1]);
    u[i] = (6.0 * u[i] / (x[i + 1] - x[i - 1]) - sig * u[i - 1]) / p;
  }
  d2[n - 1] = 0.0;
  for (size_t i = n - 1; i-- > 0;)
    d2[i] = d2[i] * d2[i + 1] + u[i];

  auto it = std::upper_bound(x.begin(), x.end(), xq);
  size_t lo = it == x.begin() ? 0 : static_cast<size_t>(it - x.begin()) - 1;
  lo = std::min(lo, n - 2);
  const size_t hi = lo + 1;
  const double h = x[hi] - x[lo];
  const double a = (x[hi] - xq) / h;
  const double b = (xq - x[lo]) / h;
  return a * y[lo] + b * y[hi] +
         ((a * a * a - a) * d2[lo] + (b * b * b - b) * d2[hi]) * (h * h) / 6.0;
}

} // namespace rfdeembed
