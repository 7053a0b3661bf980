#include <algorithm>
#include <cassert>
#include <cmath>
#include <complex>
#include <iostream>
#include <string>
#include <vector>

#include "rfdeembed/errors.hpp"
#include "rfdeembed/time_domain.hpp"
#include "synthetic_networks.hpp"

using namespace rfdeembed;
using cplx = std::complex<double>;

namespace {

const int kPoints = 200;
const double kDf = 50e6;

// exp(-j*2*pi*f*steps*dt) scaled by `amp`.
td::CVec delayed(const std::vector<double> &f, double steps, double amp) {
  const double dt = td::time_step(f);
  td::CVec s(f.size());
  for (size_t k = 0; k < f.size(); ++k)
    s[k] = amp * std::exp(cplx(0.0, -2.0 * M_PI * f[k] * steps * dt));
  return s;
}

} // namespace

void test_impulse_of_integer_delay() {
  std::cout << "test_impulse_of_integer_delay..." << std::endl;

  auto f = synth::grid(kPoints, kDf);
  assert(td::extended_length(f.size()) == 400);
  assert(std::abs(td::time_step(f) - synth::time_step(kPoints, kDf)) < 1e-24);

  td::CVec s = delayed(f, 7.0, 1.0);
  std::vector<double> h = td::impulse_response(1.0, s);
  assert(h.size() == 400);
  assert(std::abs(h[7] - 1.0) < 1e-12);
  double rest = 0.0;
  for (size_t i = 0; i < h.size(); ++i)
    if (i != 7)
      rest = std::max(rest, std::abs(h[i]));
  assert(rest < 1e-12);

  // t = 0 sits at index n after the shift
  std::vector<double> shifted = td::fftshift(h);
  assert(std::abs(shifted[kPoints + 7] - 1.0) < 1e-12);

  // Back to the spectrum
  td::CVec back = td::spectrum_of(h);
  double err = 0.0;
  for (size_t k = 0; k < s.size(); ++k)
    err = std::max(err, std::abs(back[k] - s[k]));
  assert(err < 1e-12);
}

void test_shift_and_step() {
  std::cout << "test_shift_and_step..." << std::endl;

  for (size_t len : {7u, 8u}) {
    std::vector<double> x(len);
    for (size_t i = 0; i < len; ++i)
      x[i] = static_cast<double>(i);
    assert(td::ifftshift(td::fftshift(x)) == x);
  }
  std::vector<double> odd = {0, 1, 2, 3, 4};
  std::vector<double> expected = {3, 4, 0, 1, 2};
  assert(td::fftshift(odd) == expected);

  std::vector<double> step = td::make_step({1.0, -0.5, 0.25});
  assert(step[0] == 1.0 && step[1] == 0.5 && step[2] == 0.75);
}

void test_unwrap() {
  std::cout << "test_unwrap..." << std::endl;

  std::vector<double> ramp(50), wrapped(50);
  for (int i = 0; i < 50; ++i) {
    ramp[i] = -0.4 * i;
    wrapped[i] = std::arg(std::exp(cplx(0.0, ramp[i])));
  }
  std::vector<double> u = td::unwrap(wrapped);
  for (int i = 0; i < 50; ++i)
    assert(std::abs(u[i] - ramp[i]) < 1e-12);
}

void test_dc_interp() {
  std::cout << "test_dc_interp..." << std::endl;

  auto f = synth::grid(kPoints, kDf);
  td::CVec flat(f.size(), cplx(0.3, 0.2));
  assert(std::abs(td::dc_interp(flat, f) - 0.3) < 1e-12);

  // Real part of a delayed impulse is cos(w*tau), 1 at DC
  const double dc = td::dc_interp(delayed(f, 10.0, 0.8), f);
  std::cout << "  dc estimate = " << dc << std::endl;
  assert(std::abs(dc - 0.8) < 1e-3);
}

void test_causal_dc_point() {
  std::cout << "test_causal_dc_point..." << std::endl;

  auto f = synth::grid(kPoints, kDf);
  td::CVec zero(f.size(), cplx(0.0, 0.0));
  assert(std::abs(td::causal_dc_point(zero, f)) < 1e-12);

  // A delayed reflection of 0.3 has DC value 0.3
  const double dc = td::causal_dc_point(delayed(f, 20.0, 0.3), f);
  std::cout << "  dc of delayed reflection = " << dc << std::endl;
  assert(std::abs(dc - 0.3) < 0.02);

  td::DcSolverOptions no_iterations;
  no_iterations.max_iterations = 0;
  bool threw = false;
  try {
    td::causal_dc_point(zero, f, no_iterations);
  } catch (const NonConvergence &) {
    threw = true;
  }
  assert(threw);

  // A NaN sample leaves the secant slope undefined; fail on the first pass.
  td::CVec broken = delayed(f, 20.0, 0.3);
  broken[17] = cplx(std::nan(""), 0.0);
  std::string what;
  try {
    td::causal_dc_point(broken, f);
  } catch (const NonConvergence &e) {
    what = e.what();
  }
  std::cout << "  NaN input: " << what << std::endl;
  assert(what.find("slope") != std::string::npos);
}

void test_port_impedance() {
  std::cout << "test_port_impedance..." << std::endl;

  auto f = synth::grid(kPoints, kDf);
  const double dt = td::time_step(f);
  Network line = synth::line(f, 60.0, 10.0 * dt);
  const double z =
      td::port_impedance(line.trace(0, 0), f, 50.0, td::DcSolverOptions());
  std::cout << "  TDR impedance = " << z << " ohm" << std::endl;
  assert(std::abs(z - 60.0) < 0.1);

  // The whole profile: 50 ohm before t = 0, 60 ohm inside the line
  const td::CVec s11 = line.trace(0, 0);
  const double dc0 = td::causal_dc_point(s11, f);
  std::vector<double> profile = td::tdr_impedance(
      td::make_step(td::fftshift(td::impulse_response(dc0, s11))), 50.0);
  assert(std::abs(profile[kPoints - 5] - 50.0) < 0.1);
  assert(std::abs(profile[kPoints + 10] - 60.0) < 0.1);
}

void test_reference_delay_index() {
  std::cout << "test_reference_delay_index..." << std::endl;

  auto f = synth::grid(kPoints, kDf);
  assert(td::reference_delay_index(delayed(f, 10.0, 0.8), f) == 10);
  assert(td::reference_delay_index(delayed(f, 37.0, 1.0), f) == 37);
}

void test_transmission_line() {
  std::cout << "test_transmission_line..." << std::endl;

  auto f = synth::grid(40, 0.5e9);
  td::CVec gamma = synth::line_gamma(f, 35e-12, 0.02, 0.01);

  // Matched: S21 = exp(-gamma*l), no reflection
  Network matched = td::transmission_line(f, 50.0, 50.0, gamma, 2.0);
  for (size_t k = 0; k < f.size(); ++k) {
    assert(std::abs(matched.s[k](0, 0)) < 1e-15);
    assert(std::abs(matched.s[k](1, 0) - std::exp(-2.0 * gamma[k])) < 1e-12);
  }

  // Mismatched: compare with the ABCD description of the line
  const double zl = 72.0, z0 = 50.0, len = 0.7;
  Network tl = td::transmission_line(f, zl, z0, gamma, len);
  for (size_t k = 0; k < f.size(); ++k) {
    const cplx gl = gamma[k] * len;
    const cplx A = std::cosh(gl), B = zl * std::sinh(gl);
    const cplx C = std::sinh(gl) / zl, D = std::cosh(gl);
    const cplx den = A + B / z0 + C * z0 + D;
    assert(std::abs(tl.s[k](0, 0) - (A + B / z0 - C * z0 - D) / den) < 1e-12);
    assert(std::abs(tl.s[k](1, 0) - 2.0 / den) < 1e-12);
    assert(std::abs(tl.s[k](0, 0) - tl.s[k](1, 1)) < 1e-15);
  }
}

void test_nyquist_rate_delays() {
  std::cout << "test_nyquist_rate_delays..." << std::endl;

  auto f = synth::grid(kPoints, kDf);
  Network line = synth::line(f, 60.0, 73e-12, 0.05);
  Eigen::Vector2d td_nrp = td::nyquist_rate_delays(line);
  Network aligned = td::apply_port_delays(line, td_nrp);
  for (int i = 0; i < 2; ++i) {
    const cplx sii = aligned.s.back()(i, i);
    assert(std::abs(sii.imag()) / std::abs(sii) < 1e-9);
  }
  std::cout << "  td = " << td_nrp.transpose() << " s" << std::endl;

  Network restored = td::apply_port_delays(aligned, -td_nrp);
  assert(synth::max_diff(restored, line) < 1e-12);

  // A lossless 5-step line is transparent at f_n: no phase, no delay.
  Network transparent = synth::line(f, 55.0, 5.0 * td::time_step(f));
  assert(std::abs(transparent.s.back()(0, 0)) < 1e-12);
  assert(td::nyquist_rate_delays(transparent).isZero());
}

void test_shift_points() {
  std::cout << "test_shift_points..." << std::endl;

  auto f = synth::grid(kPoints, kDf);
  Network line = synth::line(f, 45.0, 50e-12);
  Network shifted = td::shift_points(line, 6);
  td::CVec d = delayed(f, 6.0, 1.0);
  for (size_t k = 0; k < f.size(); ++k)
    assert(std::abs(shifted.s[k](1, 0) - line.s[k](1, 0) * d[k]) < 1e-12);
  assert(synth::max_diff(td::shift_points(shifted, -6), line) < 1e-12);

  // Port 2 only: two steps each way
  Network one = td::shift_one_port(line, 4, 1);
  td::CVec d2 = delayed(f, 2.0, 1.0);
  for (size_t k = 0; k < f.size(); ++k) {
    assert(std::abs(one.s[k](0, 0) - line.s[k](0, 0)) < 1e-12);
    assert(std::abs(one.s[k](1, 0) - line.s[k](1, 0) * d2[k]) < 1e-12);
    assert(std::abs(one.s[k](1, 1) - line.s[k](1, 1) * d2[k] * d2[k]) < 1e-12);
  }
}

void test_peel_uniform_line() {
  std::cout << "test_peel_uniform_line..." << std::endl;

  auto f = synth::grid(kPoints, kDf);
  const double dt = td::time_step(f);
  td::CVec half_step(f.size());
  for (size_t k = 0; k < f.size(); ++k)
    half_step[k] = cplx(0.0, M_PI * f[k] * dt);

  // 60 ohm line of 20 half-step segments, 3 peeled from each end
  Network line = td::transmission_line(f, 60.0, 50.0, half_step, 20.0);
  td::PeelResult r =
      td::peel_segments(line, 3, 50.0, half_step, 1.0, td::DcSolverOptions());
  Network expected_side = td::transmission_line(f, 60.0, 50.0, half_step, 3.0);
  Network expected_rest = td::transmission_line(f, 60.0, 50.0, half_step, 14.0);

  const double e_left = synth::max_diff(r.left, expected_side);
  const double e_right = synth::max_diff(r.right, expected_side);
  const double e_rest = synth::max_diff(r.residual, expected_rest);
  std::cout << "  side errors " << e_left << ", " << e_right
            << "; residual error " << e_rest << std::endl;
  assert(e_left < 1e-3);
  assert(e_right < 1e-3);
  assert(e_rest < 1e-3);
}

void test_peel_to_interface() {
  std::cout << "test_peel_to_interface..." << std::endl;

  auto f = synth::grid(kPoints, kDf);
  const double dt = td::time_step(f);
  td::CVec half_step(f.size());
  for (size_t k = 0; k < f.size(); ++k)
    half_step[k] = cplx(0.0, M_PI * f[k] * dt);

  // 55 ohm lines of 4 half steps on both sides of a matched 50 ohm section.
  // The last segment of each side sits right against the 55 -> 50 ohm step.
  Network lead = td::transmission_line(f, 55.0, 50.0, half_step, 4.0);
  Network mid = synth::attenuator(f, 0.8, 6.0 * dt);
  Network net = cascade(cascade(lead, mid), flipped(lead));

  td::PeelResult r = td::peel_segments(net, 4, 50.0, half_step, 1.0);
  const double e_left = synth::max_diff(r.left, lead);
  const double e_right = synth::max_diff(r.right, flipped(lead));
  const double e_rest = synth::max_diff(r.residual, mid);
  std::cout << "  side errors " << e_left << ", " << e_right
            << "; residual error " << e_rest << std::endl;
  assert(e_left < 5e-3);
  assert(e_right < 5e-3);
  assert(e_rest < 5e-3);

  // One more segment reaches into the matched section: it reads 50 ohm.
  td::PeelResult over = td::peel_segments(net, 5, 50.0, half_step, 1.0);
  Network matched_half = td::transmission_line(f, 50.0, 50.0, half_step, 1.0);
  assert(synth::max_diff(over.left, cascade(lead, matched_half)) < 5e-3);
}

void test_add_dc_point() {
  std::cout << "test_add_dc_point..." << std::endl;

  auto f = synth::grid(kPoints, kDf);
  Network att = synth::attenuator(f, 0.7, 5.0 * td::time_step(f));
  Network with_dc = td::add_dc_point(att);
  assert(with_dc.size() == f.size() + 1);
  assert(with_dc.freq.front() == 0.0);
  assert(std::abs(with_dc.s[0](1, 0) - 0.7) < 1e-3);
  assert(std::abs(with_dc.s[0](0, 0)) < 1e-12);
  for (size_t k = 0; k < f.size(); ++k)
    assert(with_dc.s[k + 1] == att.s[k]);
}

int main() {
  test_impulse_of_integer_delay();
  test_shift_and_step();
  test_unwrap();
  test_dc_interp();
  test_causal_dc_point();
  test_port_impedance();
  test_reference_delay_index();
  test_transmission_line();
  test_nyquist_rate_delays();
  test_shift_points();
  test_peel_uniform_line();
  test_peel_to_interface();
  test_add_dc_point();
  std::cout << "All time domain tests passed!" << std::endl;
  return 0;
}
