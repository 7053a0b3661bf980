#include <algorithm>
#include <cmath>
#include <complex>
#include <iostream>
#include <string>
#include <vector>

#include "rfdeembed/algebraic.hpp"
#include "rfdeembed/ieeep370.hpp"
#include "rfdeembed/io/touchstone.hpp"
#include "rfdeembed/mirror.hpp"
#include "rfdeembed/time_domain.hpp"

using namespace rfdeembed;

namespace {

// Matched lossy line with a delay of `samples` time steps.
Network lossy_line(const std::vector<double> &f, double samples, double loss) {
  const double dt = td::time_step(f);
  std::vector<Eigen::MatrixXcd> s(f.size(), Eigen::MatrixXcd::Zero(2, 2));
  for (size_t k = 0; k < f.size(); ++k) {
    const double fg = f[k] * 1e-9;
    const double alpha = loss * (0.02 * std::sqrt(fg) + 0.01 * fg);
    const std::complex<double> t =
        std::exp(std::complex<double>(-alpha, -2.0 * M_PI * f[k] * samples * dt));
    s[k](0, 1) = t;
    s[k](1, 0) = t;
  }
  return make_network(f, s, 50.0, "line");
}

// Symmetric pi: shunt C, series L, shunt C.
Network pi_thru(const std::vector<double> &f, double c, double l) {
  std::vector<Eigen::MatrixXcd> y(f.size(), Eigen::MatrixXcd(2, 2));
  for (size_t k = 0; k < f.size(); ++k) {
    const double w = 2.0 * M_PI * f[k];
    const std::complex<double> yp(0.0, w * c);
    const std::complex<double> ys = 1.0 / std::complex<double>(1.0, w * l);
    y[k] << yp + ys, -ys, -ys, yp + ys;
  }
  return from_y(f, y, Eigen::VectorXd::Constant(2, 50.0), "pi_thru");
}

double max_error(const Network &a, const Network &b) {
  double err = 0.0;
  for (size_t k = 0; k < a.size(); ++k)
    err = std::max(err, (a.s[k] - b.s[k]).cwiseAbs().maxCoeff());
  return err;
}

void report(const Deembedding &d, const Network &result, const Network &dut) {
  std::cout << d.describe() << "\n  max |S - S_dut| = " << max_error(result, dut)
            << "\n";
  for (const auto &diag : d.diagnostics())
    std::cout << "  [" << to_string(diag.kind) << "] " << diag.message << "\n";
}

} // namespace

int main(int argc, char **argv) {
  std::string prefix = argc > 1 ? argv[1] : "deembed_demo";
  int n = argc > 2 ? std::stoi(argv[2]) : 200;
  const double df = 50e6;

  std::vector<double> f(n);
  for (int k = 0; k < n; ++k)
    f[k] = df * (k + 1);

  try {
    // Reflectionless DUT between two 5-step lossy fixtures.
    Network fixture = lossy_line(f, 5.0, 1.0);
    Network dut = lossy_line(f, 3.0, 4.0);
    Network thru2x = cascade(fixture, flipped(fixture));
    Network fdf = cascade(cascade(fixture, dut), flipped(fixture));

    Ieeep370Nzc2xThru nzc(thru2x, "nzc");
    Network out_nzc = nzc.deembed(fdf);
    report(nzc, out_nzc, dut);

    Zc2xThruOptions zc_opts;
    zc_opts.bandwidth_limit = 0.5 * f.back();
    Ieeep370Zc2xThru zc(thru2x, fdf, "zc", zc_opts);
    Network out_zc = zc.deembed(fdf);
    report(zc, out_zc, dut);

    // Pi-shaped pad pair around the same DUT.
    Network pads = pi_thru(f, 50e-15, 0.1e-9);
    SplitPi split(pads, "split_pi");
    Network measured = cascade(cascade(split.left(), dut), split.right());
    report(split, split.deembed(measured), dut);

    TouchstoneOptions opts;
    opts.format = TouchstoneFormat::DB;
    write_touchstone(prefix + "_zc" + touchstone_extension(2), out_zc, opts);
    write_touchstone(prefix + "_side1" + touchstone_extension(2), zc.side1());
    write_touchstone(prefix + "_side2" + touchstone_extension(2), zc.side2());
    std::cout << "wrote " << prefix << "_*.s2p\n";
  } catch (const std::exception &e) {
    std::cerr << "deembed_demo: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
