#include <Eigen/Dense>
#include <cassert>
#include <cmath>
#include <complex>
#include <iostream>
#include <stdexcept>

#include "rfdeembed/network.hpp"
#include "synthetic_networks.hpp"

using namespace rfdeembed;
using cplx = std::complex<double>;

void test_matched_and_short() {
  std::cout << "test_matched_and_short..." << std::endl;

  Eigen::VectorXd z0(2);
  z0 << 50.0, 75.0;

  // S = 0: Z is the reference impedance on the diagonal
  Eigen::MatrixXcd Z = s_to_z(Eigen::MatrixXcd::Zero(2, 2), z0);
  Eigen::MatrixXcd expected = Eigen::MatrixXcd::Zero(2, 2);
  expected(0, 0) = 50.0;
  expected(1, 1) = 75.0;
  assert(Z.isApprox(expected, 1e-10));

  // S = -I: short circuit on both ports
  Eigen::MatrixXcd Zs = s_to_z(-Eigen::MatrixXcd::Identity(2, 2), z0);
  assert(Zs.cwiseAbs().maxCoeff() < 1e-9);

  std::cout << "  Z(S=0):\n" << Z << std::endl;
}

void test_parameter_round_trip() {
  std::cout << "test_parameter_round_trip..." << std::endl;

  Eigen::VectorXd z0(3);
  z0 << 50.0, 75.0, 25.0;
  Eigen::MatrixXcd S(3, 3);
  S << cplx(0.1, 0.2), cplx(0.3, -0.1), cplx(0.05, 0.0), cplx(0.3, -0.1),
      cplx(-0.2, 0.1), cplx(0.1, 0.1), cplx(0.05, 0.0), cplx(0.1, 0.1),
      cplx(0.4, -0.3);

  Eigen::MatrixXcd from_z_back = z_to_s(s_to_z(S, z0), z0);
  Eigen::MatrixXcd from_y_back = y_to_s(s_to_y(S, z0), z0);
  assert((from_z_back - S).cwiseAbs().maxCoeff() < 1e-12);
  assert((from_y_back - S).cwiseAbs().maxCoeff() < 1e-12);

  // Y is the inverse of Z
  Eigen::MatrixXcd prod = s_to_z(S, z0) * s_to_y(S, z0);
  assert((prod - Eigen::MatrixXcd::Identity(3, 3)).cwiseAbs().maxCoeff() <
         1e-10);
}

void test_cascade_and_inverse() {
  std::cout << "test_cascade_and_inverse..." << std::endl;

  auto f = synth::grid(20, 1e9);
  Network a = synth::line(f, 60.0, 30e-12, 0.01, 0.02);
  Network b = synth::series(f, synth::rl(5.0, 0.2e-9));
  Network thru = ideal_thru(f);

  assert(synth::max_diff(cascade(thru, a), a) < 1e-14);
  assert(synth::max_diff(cascade(a, thru), a) < 1e-14);

  // Two matched attenuators multiply their transmission
  Network t1 = synth::attenuator(f, 0.9, 10e-12);
  Network t2 = synth::attenuator(f, 0.5, 20e-12);
  Network t12 = cascade(t1, t2);
  for (size_t k = 0; k < f.size(); ++k) {
    assert(std::abs(t12.s[k](1, 0) - t1.s[k](1, 0) * t2.s[k](1, 0)) < 1e-14);
    assert(std::abs(t12.s[k](0, 0)) < 1e-14);
  }

  Network ab = cascade(a, b);
  assert(synth::max_diff(cascade(inverse(a), ab), b) < 1e-10);
  assert(synth::max_diff(cascade(ab, inverse(b)), a) < 1e-10);
  assert(synth::max_diff(cascade(inverse(ab), ab), thru) < 1e-10);

  std::cout << "  |S21(a**b)| at 20 GHz = " << std::abs(ab.s.back()(1, 0))
            << std::endl;
}

void test_flipped() {
  std::cout << "test_flipped..." << std::endl;

  auto f = synth::grid(4, 1e9);
  Eigen::MatrixXcd S(2, 2);
  S << cplx(0.1, 0.0), cplx(0.2, 0.1), cplx(0.3, -0.1), cplx(0.4, 0.2);
  Network n = synth::constant(f, S);
  n.z0 << 50.0, 25.0;
  Network fl = flipped(n);
  assert(fl.s[0](0, 0) == S(1, 1));
  assert(fl.s[0](1, 1) == S(0, 0));
  assert(fl.s[0](0, 1) == S(1, 0));
  assert(fl.s[0](1, 0) == S(0, 1));
  assert(fl.z0(0) == 25.0 && fl.z0(1) == 50.0);
  assert(synth::max_diff(flipped(fl), n) == 0.0);
}

void test_renormalize() {
  std::cout << "test_renormalize..." << std::endl;

  // A lossy line has a finite Z-matrix at every point.
  auto f = synth::grid(10, 1e9);
  Network n = synth::line(f, 65.0, 40e-12, 0.05);

  // Same network described from its Z-parameters at 75 ohm
  Network r = renormalized(n, 75.0);
  Eigen::VectorXd z75 = Eigen::VectorXd::Constant(2, 75.0);
  auto Z = z_params(n);
  for (size_t k = 0; k < f.size(); ++k)
    assert((r.s[k] - z_to_s(Z[k], z75)).cwiseAbs().maxCoeff() < 1e-12);

  // A zero-length thru stays a thru at any reference
  Network t = renormalized(ideal_thru(f), 30.0);
  assert(synth::max_diff(t, ideal_thru(f, 30.0)) < 1e-14);

  // Round trip
  assert(synth::max_diff(renormalized(r, 50.0), n) < 1e-12);

  bool threw = false;
  try {
    renormalized(n, -1.0);
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);
}

void test_cascade_mixed_reference() {
  std::cout << "test_cascade_mixed_reference..." << std::endl;

  auto f = synth::grid(10, 1e9);
  Network a = synth::line(f, 45.0, 20e-12);
  Network b = renormalized(synth::line(f, 55.0, 25e-12), 75.0);

  Network ab = cascade(a, b);
  assert(ab.z0(0) == 50.0 && ab.z0(1) == 75.0);
  Network expected = cascade(a, renormalized(b, 50.0));
  assert(synth::max_diff(renormalized(ab, 50.0), expected) < 1e-12);
}

void test_interpolated() {
  std::cout << "test_interpolated..." << std::endl;

  std::vector<double> f = {1e9, 2e9, 3e9};
  std::vector<Eigen::MatrixXcd> s;
  for (double v : {0.0, 1.0, 4.0}) {
    Eigen::MatrixXcd S(1, 1);
    S(0, 0) = cplx(v, -v);
    s.push_back(S);
  }
  Network n = make_network(f, s);

  Network mid = interpolated(n, {1.5e9, 2.5e9, 3.5e9, 0.5e9});
  assert(std::abs(mid.s[0](0, 0) - cplx(0.5, -0.5)) < 1e-12);
  assert(std::abs(mid.s[1](0, 0) - cplx(2.5, -2.5)) < 1e-12);
  // Linear extrapolation from the end segments
  assert(std::abs(mid.s[2](0, 0) - cplx(5.5, -5.5)) < 1e-12);
  assert(std::abs(mid.s[3](0, 0) - cplx(-0.5, 0.5)) < 1e-12);
}

void test_same_frequencies() {
  std::cout << "test_same_frequencies..." << std::endl;

  std::vector<double> a = {1e9, 2e9, 3e9};
  std::vector<double> b = {1e9 + 0.5, 2e9, 3e9 - 0.5};
  std::vector<double> c = {1e9, 2e9, 3.001e9};
  std::vector<double> d = {1e9, 2e9};
  assert(same_frequencies(a, b));
  assert(!same_frequencies(a, c));
  assert(!same_frequencies(a, d));
}

void test_make_network_validation() {
  std::cout << "test_make_network_validation..." << std::endl;

  bool threw = false;
  try {
    make_network({1e9, 2e9},
                 std::vector<Eigen::MatrixXcd>(1, Eigen::MatrixXcd::Zero(2, 2)));
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    cascade(synth::constant({1e9}, Eigen::MatrixXcd::Zero(3, 3)),
            ideal_thru({1e9}));
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);
}

int main() {
  test_matched_and_short();
  test_parameter_round_trip();
  test_cascade_and_inverse();
  test_flipped();
  test_renormalize();
  test_cascade_mixed_reference();
  test_interpolated();
  test_same_frequencies();
  test_make_network_validation();
  std::cout << "All network tests passed!" << std::endl;
  return 0;
}
