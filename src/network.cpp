#include "rfdeembed/network.hpp"
#include "rfdeembed/frequency_grid.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace rfdeembed {

namespace {

// A * B^-1, regularizing B when it is rank deficient.
Eigen::MatrixXcd right_divide(const Eigen::MatrixXcd &A,
                              const Eigen::MatrixXcd &B) {
  const int n = static_cast<int>(B.rows());
  Eigen::CompleteOrthogonalDecomposition<Eigen::MatrixXcd> cod(B);
  if (cod.rank() < n) {
    Eigen::MatrixXcd I = Eigen::MatrixXcd::Identity(n, n);
    Eigen::MatrixXcd B_reg = B + 1e-12 * I;
    return A * B_reg.inverse();
  }
  return A * cod.pseudoInverse();
}

Eigen::MatrixXcd sqrt_diag(const Eigen::VectorXd &z0) {
  return z0.array().sqrt().cast<std::complex<double>>().matrix().asDiagonal();
}

Eigen::MatrixXcd inv_sqrt_diag(const Eigen::VectorXd &z0) {
  return z0.array()
      .sqrt()
      .inverse()
      .cast<std::complex<double>>()
      .matrix()
      .asDiagonal();
}

void require_two_port(const Network &net, const char *what) {
  if (net.num_ports() != 2) {
    throw std::invalid_argument(std::string(what) +
                                ": network must be a 2-port");
  }
}

} // namespace

std::vector<std::complex<double>> Network::trace(int i, int j) const {
  std::vector<std::complex<double>> out(s.size());
  for (size_t k = 0; k < s.size(); ++k)
    out[k] = s[k](i, j);
  return out;
}

Network make_network(const std::vector<double> &freq,
                     const std::vector<Eigen::MatrixXcd> &s, double z0,
                     const std::string &name) {
  if (freq.size() != s.size()) {
    throw std::invalid_argument(
        "make_network: frequency and S-matrix counts differ");
  }
  if (s.empty()) {
    throw std::invalid_argument("make_network: no frequency points");
  }
  const int p = static_cast<int>(s.front().rows());
  for (const auto &m : s) {
    if (m.rows() != p || m.cols() != p) {
      throw std::invalid_argument(
          "make_network: S-matrices must be square and of equal size");
    }
  }
  Network net;
  net.freq = freq;
  net.s = s;
  net.z0 = Eigen::VectorXd::Constant(p, z0);
  net.name = name;
  return net;
}

Eigen::MatrixXcd s_to_z(const Eigen::MatrixXcd &S, const Eigen::VectorXd &z0) {
  const int n = static_cast<int>(S.rows());
  Eigen::MatrixXcd I = Eigen::MatrixXcd::Identity(n, n);
  // Z = sqrt(Z0) (I + S) (I - S)^-1 sqrt(Z0)
  Eigen::MatrixXcd G = sqrt_diag(z0);
  return G * right_divide(I + S, I - S) * G;
}

Eigen::MatrixXcd s_to_y(const Eigen::MatrixXcd &S, const Eigen::VectorXd &z0) {
  const int n = static_cast<int>(S.rows());
  Eigen::MatrixXcd I = Eigen::MatrixXcd::Identity(n, n);
  // Y = sqrt(Y0) (I - S) (I + S)^-1 sqrt(Y0)
  Eigen::MatrixXcd F = inv_sqrt_diag(z0);
  return F * right_divide(I - S, I + S) * F;
}

Eigen::MatrixXcd z_to_s(const Eigen::MatrixXcd &Z, const Eigen::VectorXd &z0) {
  const int n = static_cast<int>(Z.rows());
  Eigen::MatrixXcd I = Eigen::MatrixXcd::Identity(n, n);
  Eigen::MatrixXcd F = inv_sqrt_diag(z0);
  Eigen::MatrixXcd zn = F * Z * F;
  return right_divide(zn - I, zn + I);
}

Eigen::MatrixXcd y_to_s(const Eigen::MatrixXcd &Y, const Eigen::VectorXd &z0) {
  const int n = static_cast<int>(Y.rows());
  Eigen::MatrixXcd I = Eigen::MatrixXcd::Identity(n, n);
  Eigen::MatrixXcd G = sqrt_diag(z0);
  Eigen::MatrixXcd yn = G * Y * G;
  return right_divide(I - yn, I + yn);
}

std::vector<Eigen::MatrixXcd> z_params(const Network &net) {
  std::vector<Eigen::MatrixXcd> out;
  out.reserve(net.size());
  for (const auto &S : net.s)
    out.push_back(s_to_z(S, net.z0));
  return out;
}

std::vector<Eigen::MatrixXcd> y_params(const Network &net) {
  std::vector<Eigen::MatrixXcd> out;
  out.reserve(net.size());
  for (const auto &S : net.s)
    out.push_back(s_to_y(S, net.z0));
  return out;
}

Network from_z(const std::vector<double> &freq,
               const std::vector<Eigen::MatrixXcd> &Z,
               const Eigen::VectorXd &z0, const std::string &name) {
  if (freq.size() != Z.size()) {
    throw std::invalid_argument("from_z: frequency and matrix counts differ");
  }
  Network net;
  net.freq = freq;
  net.z0 = z0;
  net.name = name;
  net.s.reserve(Z.size());
  for (const auto &m : Z)
    net.s.push_back(z_to_s(m, z0));
  return net;
}

Network from_y(const std::vector<double> &freq,
               const std::vector<Eigen::MatrixXcd> &Y,
               const Eigen::VectorXd &z0, const std::string &name) {
  if (freq.size() != Y.size()) {
    throw std::invalid_argument("from_y: frequency and matrix counts differ");
  }
  Network net;
  net.freq = freq;
  net.z0 = z0;
  net.name = name;
  net.s.reserve(Y.size());
  for (const auto &m : Y)
    net.s.push_back(y_to_s(m, z0));
  return net;
}

Network cascade(const Network &a, const Network &b) {
  require_two_port(a, "cascade");
  require_two_port(b, "cascade");
  if (!same_frequencies(a.freq, b.freq)) {
    throw std::invalid_argument("cascade: networks have different grids");
  }

  const Network *rhs = &b;
  Network b_renorm;
  if (std::abs(a.z0(1) - b.z0(0)) > 1e-12 * std::abs(a.z0(1))) {
    Eigen::VectorXd z(2);
    z << a.z0(1), b.z0(1);
    b_renorm = renormalized(b, z);
    rhs = &b_renorm;
  }

  Network out;
  out.freq = a.freq;
  out.z0 = Eigen::VectorXd(2);
  out.z0 << a.z0(0), rhs->z0(1);
  out.name = a.name;
  out.s.reserve(a.size());
  for (size_t k = 0; k < a.size(); ++k) {
    const Eigen::MatrixXcd &A = a.s[k];
    const Eigen::MatrixXcd &B = rhs->s[k];
    std::complex<double> d = 1.0 - A(1, 1) * B(0, 0);
    Eigen::MatrixXcd S(2, 2);
    S(0, 0) = A(0, 0) + A(0, 1) * B(0, 0) * A(1, 0) / d;
    S(0, 1) = A(0, 1) * B(0, 1) / d;
    S(1, 0) = A(1, 0) * B(1, 0) / d;
    S(1, 1) = B(1, 1) + B(1, 0) * A(1, 1) * B(0, 1) / d;
    out.s.push_back(S);
  }
  return out;
}

Eigen::Matrix2cd s2t(const Eigen::MatrixXcd &S) {
  const std::complex<double> det = S(0, 0) * S(1, 1) - S(0, 1) * S(1, 0);
  Eigen::Matrix2cd T;
  T(0, 0) = -det / S(1, 0);
  T(0, 1) = S(0, 0) / S(1, 0);
  T(1, 0) = -S(1, 1) / S(1, 0);
  T(1, 1) = 1.0 / S(1, 0);
  return T;
}

Eigen::MatrixXcd t2s(const Eigen::Matrix2cd &T) {
  Eigen::MatrixXcd S(2, 2);
  S(0, 0) = T(0, 1) / T(1, 1);
  S(0, 1) = T(0, 0) - T(0, 1) * T(1, 0) / T(1, 1);
  S(1, 0) = 1.0 / T(1, 1);
  S(1, 1) = -T(1, 0) / T(1, 1);
  return S;
}

Network inverse(const Network &net) {
  require_two_port(net, "inverse");
  Network out;
  out.freq = net.freq;
  out.z0 = Eigen::VectorXd(2);
  out.z0 << net.z0(1), net.z0(0);
  out.name = net.name;
  out.s.reserve(net.size());
  for (const auto &S : net.s)
    out.s.push_back(t2s(s2t(S).inverse()));
  return out;
}

Network flipped(const Network &net) {
  require_two_port(net, "flipped");
  Network out = net;
  out.z0 << net.z0(1), net.z0(0);
  for (auto &S : out.s) {
    std::swap(S(0, 0), S(1, 1));
    std::swap(S(0, 1), S(1, 0));
  }
  return out;
}

Network renormalized(const Network &net, const Eigen::VectorXd &z_new) {
  const int p = net.num_ports();
  if (z_new.size() != p) {
    throw std::invalid_argument(
        "renormalized: impedance vector does not match port count");
  }
  if ((z_new.array() <= 0.0).any()) {
    throw std::invalid_argument(
        "renormalized: reference impedances must be positive");
  }

  // S' = K (S - R) (I - R S)^-1 K^-1 with R = (z'-z)/(z'+z) and
  // K = (z+z')/(2 sqrt(z z')), all diagonal.
  Eigen::VectorXcd r(p), k(p);
  for (int i = 0; i < p; ++i) {
    const double z = net.z0(i), zn = z_new(i);
    r(i) = (zn - z) / (zn + z);
    k(i) = (z + zn) / (2.0 * std::sqrt(z * zn));
  }
  Eigen::MatrixXcd R = r.asDiagonal();
  Eigen::MatrixXcd K = k.asDiagonal();
  Eigen::MatrixXcd K_inv = k.cwiseInverse().asDiagonal();
  Eigen::MatrixXcd I = Eigen::MatrixXcd::Identity(p, p);

  Network out = net;
  out.z0 = z_new;
  for (auto &S : out.s)
    S = K * right_divide(S - R, I - R * S) * K_inv;
  return out;
}

Network renormalized(const Network &net, double z_new) {
  return renormalized(net, Eigen::VectorXd::Constant(net.num_ports(), z_new));
}

Network interpolated(const Network &net, const std::vector<double> &freq_new) {
  if (net.empty()) {
    throw std::invalid_argument("interpolated: empty network");
  }
  const int p = net.num_ports();
  Network out;
  out.freq = freq_new;
  out.z0 = net.z0;
  out.name = net.name;
  out.s.assign(freq_new.size(), Eigen::MatrixXcd::Zero(p, p));
  for (int i = 0; i < p; ++i) {
    for (int j = 0; j < p; ++j) {
      auto y = interp_linear(net.freq, net.trace(i, j), freq_new);
      for (size_t k = 0; k < freq_new.size(); ++k)
        out.s[k](i, j) = y[k];
    }
  }
  return out;
}

Network ideal_thru(const std::vector<double> &freq, double z0) {
  Eigen::MatrixXcd S(2, 2);
  S << 0.0, 1.0, 1.0, 0.0;
  return make_network(freq, std::vector<Eigen::MatrixXcd>(freq.size(), S), z0,
                      "thru");
}

bool same_frequencies(const std::vector<double> &a,
                      const std::vector<double> &b) {
  if (a.size() != b.size())
    return false;
  for (size_t i = 0; i < a.size(); ++i) {
    const double scale = std::max(1.0, std::max(std::abs(a[i]), std::abs(b[i])));
    if (std::abs(a[i] - b[i]) > 1e-9 * scale)
      return false;
  }
  return true;
}

} // namespace rfdeembed
