#include "rfdeembed/time_domain.hpp"
#include "rfdeembed/errors.hpp"
#include "rfdeembed/frequency_grid.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <unsupported/Eigen/FFT>

namespace rfdeembed {
namespace td {

namespace {

constexpr double kTwoPi = 2.0 * M_PI;
// |S_ii(f_end)| below which its phase is rounding noise.
constexpr double kNyquistFloor = 1e-9;

void require_grid(const std::vector<double> &f, size_t min_points,
                  const char *what) {
  if (f.size() < min_points) {
    throw std::invalid_argument(std::string(what) + ": need at least " +
                                std::to_string(min_points) +
                                " frequency points");
  }
}

// Digital frequency 2*pi*f*dt of every sample.
std::vector<double> digital_frequency(const std::vector<double> &f) {
  const double dt = time_step(f);
  std::vector<double> omega(f.size());
  for (size_t k = 0; k < f.size(); ++k)
    omega[k] = kTwoPi * f[k] * dt;
  return omega;
}

} // namespace

double time_step(const std::vector<double> &f) {
  require_grid(f, 2, "time_step");
  const double df = f[1] - f[0];
  return 1.0 / (static_cast<double>(extended_length(f.size())) * df);
}

Eigen::VectorXcd make_symmetric(double dc, const CVec &s) {
  const int n = static_cast<int>(s.size());
  const int N = extended_length(s.size());
  Eigen::VectorXcd X(N);
  X(0) = dc;
  for (int k = 1; k < n; ++k) {
    X(k) = s[k - 1];
    X(N - k) = std::conj(s[k - 1]);
  }
  if (n > 0)
    X(n) = s[n - 1].real();
  return X;
}

std::vector<double> impulse_response(double dc, const CVec &s) {
  Eigen::FFT<double> fft;
  Eigen::VectorXcd X = make_symmetric(dc, s);
  Eigen::VectorXcd x;
  fft.inv(x, X);
  std::vector<double> out(x.size());
  for (Eigen::Index i = 0; i < x.size(); ++i)
    out[i] = x(i).real();
  return out;
}

CVec spectrum_of(const std::vector<double> &impulse) {
  const int N = static_cast<int>(impulse.size());
  const int n = N / 2;
  Eigen::VectorXcd x(N);
  for (int i = 0; i < N; ++i)
    x(i) = impulse[i];
  Eigen::FFT<double> fft;
  Eigen::VectorXcd X;
  fft.fwd(X, x);
  CVec out(n);
  for (int k = 1; k <= n; ++k)
    out[k - 1] = X(k);
  return out;
}

std::vector<double> fftshift(const std::vector<double> &x) {
  const size_t N = x.size();
  std::vector<double> out(N);
  const size_t half = N / 2;
  for (size_t k = 0; k < N; ++k)
    out[(k + half) % N] = x[k];
  return out;
}

std::vector<double> ifftshift(const std::vector<double> &x) {
  const size_t N = x.size();
  std::vector<double> out(N);
  const size_t half = N / 2;
  for (size_t k = 0; k < N; ++k)
    out[k] = x[(k + half) % N];
  return out;
}

std::vector<double> make_step(const std::vector<double> &impulse) {
  std::vector<double> step(impulse.size());
  double acc = 0.0;
  for (size_t i = 0; i < impulse.size(); ++i) {
    acc += impulse[i];
    step[i] = acc;
  }
  return step;
}

std::vector<double> unwrap(const std::vector<double> &phase) {
  std::vector<double> out(phase.size());
  if (phase.empty())
    return out;
  out[0] = phase[0];
  for (size_t i = 1; i < phase.size(); ++i) {
    double d = phase[i] - phase[i - 1];
    d -= kTwoPi * std::round(d / kTwoPi);
    out[i] = out[i - 1] + d;
  }
  return out;
}

double dc_interp(const CVec &s, const std::vector<double> &f) {
  require_grid(f, 2, "dc_interp");
  const size_t m = std::min<size_t>(9, std::min(s.size(), f.size()));
  // Real part of a conjugate-symmetric trace is even in f.
  std::vector<double> x, y;
  x.reserve(2 * m);
  y.reserve(2 * m);
  for (size_t i = m; i-- > 0;) {
    x.push_back(-f[i]);
    y.push_back(s[i].real());
  }
  for (size_t i = 0; i < m; ++i) {
    x.push_back(f[i]);
    y.push_back(s[i].real());
  }
  return natural_spline_eval(x, y, 0.0);
}

CVec com_receiver_noise_filter(const std::vector<double> &f, double fr) {
  CVec H(f.size());
  for (size_t k = 0; k < f.size(); ++k) {
    const double x = f[k] / fr;
    const double x2 = x * x;
    H[k] = 1.0 / std::complex<double>(1.0 - 3.414214 * x2 + x2 * x2,
                                      2.613126 * (x - x2 * x));
  }
  return H;
}

double causal_dc_point(const CVec &s, const std::vector<double> &f,
                       const DcSolverOptions &opts) {
  require_grid(f, 2, "causal_dc_point");
  const int n = static_cast<int>(f.size());
  const double dt = time_step(f);
  const int ts = std::max(0, n + static_cast<int>(std::lround(-3e-9 / dt)));

  const CVec Hr = com_receiver_noise_filter(f, f.back() / 2.0);
  CVec filtered(s.size());
  for (size_t k = 0; k < s.size(); ++k)
    filtered[k] = Hr[k] * s[k];

  auto step_at = [&](double dc) {
    return make_step(fftshift(impulse_response(dc, filtered)))[ts];
  };

  // The step value at ts is affine in the DC value; a secant step solves it.
  double dc = 0.002;
  const double delta = 0.001;
  for (int it = 0; it < opts.max_iterations; ++it) {
    const double h1 = step_at(dc);
    const double h2 = step_at(dc + delta);
    const double m = (h2 - h1) / delta;
    if (!std::isfinite(m) || m == 0.0) {
      throw NonConvergence("causal_dc_point: secant slope is zero or not "
                           "finite");
    }
    const double b = h1 - m * dc;
    const double err = std::abs(h1);
    dc = -b / m;
    if (!std::isfinite(dc)) {
      throw NonConvergence("causal_dc_point: DC estimate is not finite");
    }
    if (err <= opts.tolerance)
      return dc;
  }
  throw NonConvergence("causal_dc_point: no convergence after " +
                       std::to_string(opts.max_iterations) + " iterations");
}

std::vector<double> tdr_impedance(const std::vector<double> &step, double z0) {
  std::vector<double> z(step.size());
  for (size_t i = 0; i < step.size(); ++i)
    z[i] = -z0 * (step[i] + 1.0) / (step[i] - 1.0);
  return z;
}

double port_impedance(const CVec &s, const std::vector<double> &f, double z0,
                      const DcSolverOptions &opts) {
  const double dc = causal_dc_point(s, f, opts);
  std::vector<double> step = make_step(fftshift(impulse_response(dc, s)));
  return tdr_impedance(step, z0)[f.size()];
}

int reference_delay_index(const CVec &s21, const std::vector<double> &f) {
  const double dc = dc_interp(s21, f);
  std::vector<double> t21 = fftshift(impulse_response(dc, s21));
  auto peak = std::max_element(t21.begin(), t21.end());
  return static_cast<int>(peak - t21.begin()) - static_cast<int>(f.size());
}

Network transmission_line(const std::vector<double> &f, double zline,
                          double z0, const CVec &gamma, double length) {
  if (gamma.size() != f.size()) {
    throw std::invalid_argument(
        "transmission_line: gamma and frequency sizes differ");
  }
  std::vector<Eigen::MatrixXcd> s(f.size(), Eigen::MatrixXcd(2, 2));
  const double zl2 = zline * zline, z02 = z0 * z0;
  for (size_t k = 0; k < f.size(); ++k) {
    const std::complex<double> gl = gamma[k] * length;
    const std::complex<double> den =
        (zl2 + z02) * std::sinh(gl) + 2.0 * z0 * zline * std::cosh(gl);
    const std::complex<double> refl = (zl2 - z02) * std::sinh(gl) / den;
    const std::complex<double> trans = 2.0 * z0 * zline / den;
    s[k] << refl, trans, trans, refl;
  }
  return make_network(f, s, z0, "line");
}

Network delay_thru(const std::vector<double> &f, double delay, double z0) {
  std::vector<Eigen::MatrixXcd> s(f.size(), Eigen::MatrixXcd::Zero(2, 2));
  for (size_t k = 0; k < f.size(); ++k) {
    const std::complex<double> d =
        std::exp(std::complex<double>(0.0, -kTwoPi * f[k] * delay));
    s[k](0, 1) = d;
    s[k](1, 0) = d;
  }
  return make_network(f, s, z0, "delay");
}

Network shift_points(const Network &net, int N) {
  const double half = 0.5 * N * time_step(net.freq);
  Network left = delay_thru(net.freq, half, net.z0(0));
  Network right = delay_thru(net.freq, half, net.z0(1));
  return cascade(cascade(left, net), right);
}

Network shift_one_port(const Network &net, int N, int port) {
  const double half = 0.5 * N * time_step(net.freq);
  if (port == 0)
    return cascade(delay_thru(net.freq, half, net.z0(0)), net);
  if (port == 1)
    return cascade(net, delay_thru(net.freq, half, net.z0(1)));
  throw std::invalid_argument("shift_one_port: port must be 0 or 1");
}

PeelResult peel_segments(const Network &net, int count, double z0,
                         const CVec &gamma, double length,
                         const DcSolverOptions &opts) {
  const std::vector<double> &f = net.freq;
  PeelResult r{net, ideal_thru(f, z0), ideal_thru(f, z0)};
  for (int i = 0; i < count; ++i) {
    const double z1 = port_impedance(r.residual.trace(0, 0), f, z0, opts);
    const double z2 = port_impedance(r.residual.trace(1, 1), f, z0, opts);
    Network seg1 = transmission_line(f, z1, z0, gamma, length);
    Network seg2 = flipped(transmission_line(f, z2, z0, gamma, length));
    r.residual = cascade(cascade(inverse(seg1), r.residual), inverse(seg2));
    r.left = cascade(r.left, seg1);
    r.right = cascade(seg2, r.right);
  }
  return r;
}

PeelResult peel_lossless(const Network &net, int N, double z0,
                         const DcSolverOptions &opts) {
  const std::vector<double> omega = digital_frequency(net.freq);
  CVec gamma(omega.size());
  for (size_t k = 0; k < omega.size(); ++k)
    gamma[k] = std::complex<double>(0.0, omega[k] / 2.0);
  return peel_segments(net, N, z0, gamma, 1.0, opts);
}

Network add_dc_point(const Network &net) {
  const int p = net.num_ports();
  Network out;
  out.freq.reserve(net.size() + 1);
  out.freq.push_back(0.0);
  out.freq.insert(out.freq.end(), net.freq.begin(), net.freq.end());
  out.s.reserve(net.size() + 1);
  out.s.push_back(Eigen::MatrixXcd::Zero(p, p));
  out.s.insert(out.s.end(), net.s.begin(), net.s.end());
  out.z0 = net.z0;
  out.name = net.name;
  for (int i = 0; i < p; ++i)
    for (int j = 0; j < p; ++j)
      out.s[0](i, j) = dc_interp(net.trace(i, j), net.freq);
  return out;
}

Eigen::Vector2d nyquist_rate_delays(const Network &net) {
  if (net.num_ports() != 2) {
    throw std::invalid_argument("nyquist_rate_delays: network must be a 2-port");
  }
  const double fend = net.freq.back();
  Eigen::Vector2d td;
  for (int i = 0; i < 2; ++i) {
    const std::complex<double> sii = net.s.back()(i, i);
    if (std::abs(sii) < kNyquistFloor) {
      td(i) = 0.0;
      continue;
    }
    const double theta0 = std::arg(sii);
    double theta;
    if (theta0 < -M_PI / 2)
      theta = -M_PI - theta0;
    else if (theta0 > M_PI / 2)
      theta = M_PI - theta0;
    else
      theta = -theta0;
    td(i) = -theta / (kTwoPi * fend);
  }
  return td;
}

Network apply_port_delays(const Network &net, const Eigen::Vector2d &td) {
  Network left = delay_thru(net.freq, td(0) / 2.0, net.z0(0));
  Network right = delay_thru(net.freq, td(1) / 2.0, net.z0(1));
  return cascade(cascade(left, net), right);
}

} // namespace td
} // namespace rfdeembed
