#include "rfdeembed/mirror.hpp"

#include <vector>

namespace rfdeembed {

namespace {

Network split_pi_left(const Network &thru) {
  std::vector<Eigen::MatrixXcd> Y = y_params(thru);
  for (auto &m : Y) {
    const std::complex<double> y11 = m(0, 0), y12 = m(0, 1), y21 = m(1, 0),
                               y22 = m(1, 1);
    Eigen::MatrixXcd h(2, 2);
    h(0, 0) = (y11 - y21 + y22 - y12) / 2.0;
    h(0, 1) = y21 + y12;
    h(1, 0) = y21 + y12;
    h(1, 1) = -y21 - y12;
    m = h;
  }
  return from_y(thru.freq, Y, thru.z0, thru.name + "_left");
}

Network split_tee_left(const Network &thru) {
  std::vector<Eigen::MatrixXcd> Z = z_params(thru);
  for (auto &m : Z) {
    const std::complex<double> z11 = m(0, 0), z12 = m(0, 1), z21 = m(1, 0),
                               z22 = m(1, 1);
    Eigen::MatrixXcd h(2, 2);
    h(0, 0) = (z11 + z21 + z22 + z12) / 2.0;
    h(0, 1) = z21 + z12;
    h(1, 0) = z21 + z12;
    h(1, 1) = z21 + z12;
    m = h;
  }
  return from_z(thru.freq, Z, thru.z0, thru.name + "_left");
}

// inverse(left) ** meas ** inverse(right)
Network strip_halves(const Network &left, const Network &measured,
                     const Network &right) {
  Network out = cascade(cascade(inverse(left), measured), inverse(right));
  out.name = measured.name;
  return out;
}

// 0.5 * (P(h) + P(flipped h)) for P = Y or Z.
std::vector<Eigen::MatrixXcd>
port_average(const std::vector<Eigen::MatrixXcd> &a,
             const std::vector<Eigen::MatrixXcd> &b) {
  std::vector<Eigen::MatrixXcd> out(a.size());
  for (size_t k = 0; k < a.size(); ++k)
    out[k] = 0.5 * (a[k] + b[k]);
  return out;
}

} // namespace

SplitPi::SplitPi(const Network &dummy_thru, const std::string &name)
    : Deembedding({dummy_thru}, name) {
  require_ports(dummy_thru, 2, "SplitPi");
  left_ = split_pi_left(dummy_thru);
  right_ = flipped(left_);
}

Network SplitPi::deembed(const Network &measured) const {
  check_frequencies(measured);
  return strip_halves(left_, measured, right_);
}

SplitTee::SplitTee(const Network &dummy_thru, const std::string &name)
    : Deembedding({dummy_thru}, name) {
  require_ports(dummy_thru, 2, "SplitTee");
  left_ = split_tee_left(dummy_thru);
  right_ = flipped(left_);
}

Network SplitTee::deembed(const Network &measured) const {
  check_frequencies(measured);
  return strip_halves(left_, measured, right_);
}

AdmittanceCancel::AdmittanceCancel(const Network &dummy_thru,
                                   const std::string &name)
    : Deembedding({dummy_thru}, name) {
  require_ports(dummy_thru, 2, "AdmittanceCancel");
}

Network AdmittanceCancel::deembed(const Network &measured) const {
  check_frequencies(measured);
  Network h = cascade(measured, inverse(dummies()[0]));
  return from_y(h.freq, port_average(y_params(h), y_params(flipped(h))), h.z0,
                measured.name);
}

ImpedanceCancel::ImpedanceCancel(const Network &dummy_thru,
                                 const std::string &name)
    : Deembedding({dummy_thru}, name) {
  require_ports(dummy_thru, 2, "ImpedanceCancel");
}

Network ImpedanceCancel::deembed(const Network &measured) const {
  check_frequencies(measured);
  Network h = cascade(measured, inverse(dummies()[0]));
  return from_z(h.freq, port_average(z_params(h), z_params(flipped(h))), h.z0,
                measured.name);
}

} // namespace rfdeembed
