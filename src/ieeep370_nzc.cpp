#include "rfdeembed/errors.hpp"
#include "rfdeembed/frequency_grid.hpp"
#include "rfdeembed/ieeep370.hpp"

#include <cmath>
#include <vector>

namespace rfdeembed {

namespace {

// Reflection with everything from shifted index `cut` onward gated out.
td::CVec gated_reflection(const td::CVec &s, const std::vector<double> &f,
                          int cut, const td::DcSolverOptions &dc_opts) {
  const double dc = td::causal_dc_point(s, f, dc_opts);
  std::vector<double> t = td::fftshift(td::impulse_response(dc, s));
  for (size_t i = static_cast<size_t>(cut); i < t.size(); ++i)
    t[i] = 0.0;
  return td::spectrum_of(td::ifftshift(t));
}

// k * sqrt(t * (1 - e111 * e112)) with k flipped whenever the principal root
// turns counter-clockwise, keeping the phase continuous across branch cuts.
td::CVec continuous_root(const td::CVec &t, const td::CVec &e111,
                         const td::CVec &e112) {
  td::CVec out(t.size());
  double k = 1.0;
  std::complex<double> prev;
  for (size_t i = 0; i < t.size(); ++i) {
    const std::complex<double> root = std::sqrt(t[i] * (1.0 - e111[i] * e112[i]));
    if (i > 0 && std::arg(root) - std::arg(prev) > 0.0)
      k = -k;
    out[i] = k * root;
    prev = root;
  }
  return out;
}

} // namespace

Ieeep370Nzc2xThru::Ieeep370Nzc2xThru(const Network &dummy_2xthru,
                                     const std::string &name,
                                     const Nzc2xThruOptions &opts)
    : Deembedding({dummy_2xthru}, name), opts_(opts) {
  require_ports(dummy_2xthru, 2, "Ieeep370Nzc2xThru");
  if (opts_.z0 <= 0.0) {
    throw ConfigError("Ieeep370Nzc2xThru: z0 must be positive");
  }
  if (opts_.dc_tolerance <= 0.0) {
    throw ConfigError("Ieeep370Nzc2xThru: dc_tolerance must be positive");
  }
  split_2xthru(dummy_2xthru);
}

void Ieeep370Nzc2xThru::split_2xthru(const Network &s2xthru) {
  Network work = s2xthru;
  if (!work.z0.isApprox(Eigen::VectorXd::Constant(2, opts_.z0)))
    work = renormalized(work, opts_.z0);

  const bool flag_dc = has_dc_point(work.freq);
  if (flag_dc) {
    work = strip_dc(work);
    add_diagnostic(DiagnosticKind::DcPointStripped,
                   "DC point detected. An interpolated DC point will be "
                   "included in the error boxes.",
                   opts_.verbose);
  }
  const std::vector<double> f_org = work.freq;
  const bool flag_df = !is_uniform(work.freq);
  if (flag_df) {
    if (flag_dc) {
      throw UnsupportedCombination(
          "Ieeep370Nzc2xThru: a DC point on a non-uniform frequency grid is "
          "not supported");
    }
    work = interpolated(work, uniform_grid_for(work.freq));
    add_diagnostic(DiagnosticKind::NonUniformGrid,
                   "Non-uniform frequency vector detected. The error boxes "
                   "are computed on a uniform grid and re-interpolated.",
                   opts_.verbose);
  }

  const std::vector<double> &f = work.freq;
  const int n = static_cast<int>(f.size());
  const td::DcSolverOptions dc_opts{opts_.dc_tolerance,
                                    opts_.max_dc_iterations};

  // Midpoint of the 2x-thru in time steps.
  const int x = td::reference_delay_index(work.trace(1, 0), f);
  if (x <= 0) {
    throw ConfigError(
        "Ieeep370Nzc2xThru: 2x-thru transmission delay is below one time step");
  }

  // Impedance at the midpoint becomes the reference of the split.
  const td::CVec s11 = work.trace(0, 0);
  const double dc11 = td::causal_dc_point(s11, f, dc_opts);
  const std::vector<double> step11 =
      td::make_step(td::fftshift(td::impulse_response(dc11, s11)));
  const double z11x = td::tdr_impedance(step11, opts_.z0)[n + x];

  Network r = renormalized(work, z11x);
  const td::CVec s11r = r.trace(0, 0), s21r = r.trace(1, 0),
                 s12r = r.trace(0, 1), s22r = r.trace(1, 1);

  const td::CVec e001 = gated_reflection(s11r, f, n + x, dc_opts);
  const td::CVec e002 = gated_reflection(s22r, f, n + x, dc_opts);

  td::CVec e111(n), e112(n);
  for (int i = 0; i < n; ++i) {
    e111[i] = (s22r[i] - e002[i]) / s12r[i];
    e112[i] = (s11r[i] - e001[i]) / s21r[i];
  }
  const td::CVec e01 = continuous_root(s21r, e111, e112);
  const td::CVec e10 = continuous_root(s12r, e111, e112);

  std::vector<Eigen::MatrixXcd> m1(n, Eigen::MatrixXcd(2, 2));
  std::vector<Eigen::MatrixXcd> m2(n, Eigen::MatrixXcd(2, 2));
  for (int i = 0; i < n; ++i) {
    m1[i] << e001[i], e01[i], e01[i], e111[i];
    m2[i] << e112[i], e10[i], e10[i], e002[i];
  }
  Network box1 = renormalized(make_network(f, m1, z11x, "side1"), opts_.z0);
  Network box2 = renormalized(make_network(f, m2, z11x, "side2"), opts_.z0);

  if (flag_df) {
    box1 = interpolated(box1, f_org);
    box2 = interpolated(box2, f_org);
  }
  if (flag_dc) {
    box1 = td::add_dc_point(box1);
    box2 = td::add_dc_point(box2);
    add_diagnostic(DiagnosticKind::DcPointRestored,
                   "DC point of the error boxes interpolated from the lowest "
                   "frequencies.",
                   opts_.verbose);
  }
  side1_ = box1;
  side2_ = box2;
}

Network Ieeep370Nzc2xThru::deembed(const Network &measured) const {
  check_frequencies(measured);
  Network out =
      cascade(cascade(inverse(side1_), measured), inverse(side2_));
  out.name = measured.name;
  return out;
}

} // namespace rfdeembed
