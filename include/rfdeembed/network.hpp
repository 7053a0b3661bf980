#pragma once

#include <Eigen/Core>
#include <complex>
#include <string>
#include <vector>

namespace rfdeembed {

/// Frequency-sampled multiport network in scattering form.
/// `s[k]` is the P×P scattering matrix at `freq[k]` (Hz), referenced to the
/// real, positive per-port impedances in `z0`.
struct Network {
  std::vector<double> freq;
  std::vector<Eigen::MatrixXcd> s;
  Eigen::VectorXd z0;
  std::string name;

  int num_ports() const { return static_cast<int>(z0.size()); }
  size_t size() const { return freq.size(); }
  bool empty() const { return freq.empty(); }

  /// Single S-parameter trace S(i,j) over frequency.
  std::vector<std::complex<double>> trace(int i, int j) const;
};

/// Build a network with a uniform reference impedance on all ports.
/// @throws std::invalid_argument if sizes disagree or matrices are not square
Network make_network(const std::vector<double> &freq,
                     const std::vector<Eigen::MatrixXcd> &s, double z0 = 50.0,
                     const std::string &name = "");

// Per-frequency conversions at real reference impedances.
Eigen::MatrixXcd s_to_z(const Eigen::MatrixXcd &S, const Eigen::VectorXd &z0);
Eigen::MatrixXcd s_to_y(const Eigen::MatrixXcd &S, const Eigen::VectorXd &z0);
Eigen::MatrixXcd z_to_s(const Eigen::MatrixXcd &Z, const Eigen::VectorXd &z0);
Eigen::MatrixXcd y_to_s(const Eigen::MatrixXcd &Y, const Eigen::VectorXd &z0);

/// Impedance matrices of every frequency point.
std::vector<Eigen::MatrixXcd> z_params(const Network &net);
/// Admittance matrices of every frequency point.
std::vector<Eigen::MatrixXcd> y_params(const Network &net);

Network from_z(const std::vector<double> &freq,
               const std::vector<Eigen::MatrixXcd> &Z,
               const Eigen::VectorXd &z0, const std::string &name = "");
Network from_y(const std::vector<double> &freq,
               const std::vector<Eigen::MatrixXcd> &Y,
               const Eigen::VectorXd &z0, const std::string &name = "");

/// Connect port 2 of `a` to port 1 of `b` (Redheffer star product).
/// If the connected reference impedances differ, `b` is renormalized first.
/// @throws std::invalid_argument unless both are 2-ports on the same grid
Network cascade(const Network &a, const Network &b);

/// 2-port inverse such that cascade(inverse(n), n) is a thru.
Network inverse(const Network &net);

/// 2-port with its ports exchanged.
Network flipped(const Network &net);

/// Re-reference every port to a new real impedance.
Network renormalized(const Network &net, const Eigen::VectorXd &z_new);
Network renormalized(const Network &net, double z_new);

/// Linear interpolation of the real and imaginary parts onto `freq_new`.
/// Points outside the input span are extrapolated from the end segments.
Network interpolated(const Network &net, const std::vector<double> &freq_new);

/// Matched, zero-length 2-port thru on the given grid.
Network ideal_thru(const std::vector<double> &freq, double z0 = 50.0);

/// True if both grids have the same length and agree point by point within
/// 1e-9 relative tolerance.
bool same_frequencies(const std::vector<double> &a,
                      const std::vector<double> &b);

// 2-port scattering <-> cascading (T) parameters.
Eigen::Matrix2cd s2t(const Eigen::MatrixXcd &S);
Eigen::MatrixXcd t2s(const Eigen::Matrix2cd &T);

} // namespace rfdeembed
