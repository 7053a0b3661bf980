#include "rfdeembed/errors.hpp"
#include "rfdeembed/frequency_grid.hpp"
#include "rfdeembed/ieeep370.hpp"

#include <Eigen/Dense>
#include <cmath>
#include <string>
#include <vector>

namespace rfdeembed {

Ieeep370Zc2xThru::Ieeep370Zc2xThru(const Network &dummy_2xthru,
                                   const Network &dummy_fix_dut_fix,
                                   const std::string &name,
                                   const Zc2xThruOptions &opts)
    : Deembedding({dummy_2xthru}, name), opts_(opts), fdf_(dummy_fix_dut_fix) {
  require_ports(dummy_2xthru, 2, "Ieeep370Zc2xThru");
  if (fdf_.empty()) {
    throw ConfigError("Ieeep370Zc2xThru: fixture-DUT-fixture has no data");
  }
  require_ports(fdf_, 2, "Ieeep370Zc2xThru");
  validate_options();
  split_2xthru(dummy_2xthru, fdf_);
}

void Ieeep370Zc2xThru::validate_options() const {
  if (opts_.z0 <= 0.0)
    throw ConfigError("Ieeep370Zc2xThru: z0 must be positive");
  if (opts_.bandwidth_limit < 0.0)
    throw ConfigError("Ieeep370Zc2xThru: bandwidth_limit must not be negative");
  if (opts_.pullback1 < 0 || opts_.pullback2 < 0)
    throw ConfigError("Ieeep370Zc2xThru: pullback must not be negative");
  if (opts_.leadin < 0)
    throw ConfigError("Ieeep370Zc2xThru: leadin must not be negative");
  if (opts_.dc_tolerance <= 0.0)
    throw ConfigError("Ieeep370Zc2xThru: dc_tolerance must be positive");

  if (opts_.pullback1 != opts_.pullback2) {
    throw UnsupportedCombination(
        "Ieeep370Zc2xThru: asymmetric pullbacks are not supported");
  }
  if (opts_.side1 != opts_.side2) {
    throw UnsupportedCombination(
        "Ieeep370Zc2xThru: extracting only one side is not supported");
  }
}

void Ieeep370Zc2xThru::estimate_gamma(const Network &s2xthru) {
  const std::vector<double> &f = s2xthru.freq;
  const size_t n = f.size();

  std::vector<double> phase(n);
  Eigen::VectorXd alpha(n);
  for (size_t k = 0; k < n; ++k) {
    const std::complex<double> s21 = s2xthru.s[k](1, 0);
    const std::complex<double> s22 = s2xthru.s[k](1, 1);
    phase[k] = std::arg(s21);
    // Loss in Np with the output mismatch removed.
    const double attenuation = std::norm(s21) / (1.0 - std::norm(s22));
    alpha(k) = -0.5 * std::log(attenuation);
  }
  const std::vector<double> unwrapped = td::unwrap(phase);

  if (opts_.bandwidth_limit > 0.0) {
    // Skin, dielectric and roughness terms: sqrt(f), f, f^2 with f in GHz.
    size_t bwl = 0;
    for (size_t k = 1; k < n; ++k) {
      if (std::abs(f[k] - opts_.bandwidth_limit) <
          std::abs(f[bwl] - opts_.bandwidth_limit))
        bwl = k;
    }
    if (bwl < 3) {
      throw ConfigError("Ieeep370Zc2xThru: bandwidth_limit leaves fewer than "
                        "3 points for the loss fit");
    }
    Eigen::MatrixXd A(bwl, 3);
    for (size_t k = 0; k < bwl; ++k) {
      const double fg = f[k] * 1e-9;
      A(k, 0) = std::sqrt(fg);
      A(k, 1) = fg;
      A(k, 2) = fg * fg;
    }
    Eigen::Vector3d b = A.colPivHouseholderQr().solve(alpha.head(bwl));
    for (size_t k = 0; k < n; ++k) {
      const double fg = f[k] * 1e-9;
      alpha(k) = b(0) * std::sqrt(fg) + b(1) * fg + b(2) * fg * fg;
    }
  }

  gamma_.resize(n);
  for (size_t k = 0; k < n; ++k)
    gamma_[k] = std::complex<double>(alpha(k), -unwrapped[k]);
}

void Ieeep370Zc2xThru::split_2xthru(const Network &s2xthru,
                                    const Network &fdf) {
  if (!opts_.side1 && !opts_.side2) {
    side1_ = ideal_thru(s2xthru.freq, opts_.z0);
    side2_ = ideal_thru(s2xthru.freq, opts_.z0);
    add_diagnostic(DiagnosticKind::NoOutputRequested,
                   "Neither side requested; error boxes are ideal thrus.",
                   opts_.verbose);
    return;
  }

  const Eigen::VectorXd z_ref = Eigen::VectorXd::Constant(2, opts_.z0);
  Network fdf_w = fdf.z0.isApprox(z_ref) ? fdf : renormalized(fdf, opts_.z0);
  Network thru_w =
      s2xthru.z0.isApprox(z_ref) ? s2xthru : renormalized(s2xthru, opts_.z0);

  // Bring the fixture-DUT-fixture onto a grid f_k = k*df.
  const std::vector<double> f_fdf = fdf_w.freq;
  const bool flag_dc = has_dc_point(fdf_w.freq);
  if (flag_dc) {
    fdf_w = strip_dc(fdf_w);
    add_diagnostic(DiagnosticKind::DcPointStripped,
                   "DC point detected. The included DC point will not be used "
                   "during extraction.",
                   opts_.verbose);
  }
  const std::vector<double> f_stripped = fdf_w.freq;
  const bool flag_df = !is_uniform(fdf_w.freq);
  if (flag_df) {
    fdf_w = interpolated(fdf_w, uniform_grid_for(fdf_w.freq));
    add_diagnostic(DiagnosticKind::NonUniformGrid,
                   "Non-uniform frequency vector detected. The error boxes "
                   "are computed on a uniform grid and re-interpolated.",
                   opts_.verbose);
  }
  const std::vector<double> &f = fdf_w.freq;

  if (same_frequencies(thru_w.freq, f_fdf)) {
    if (flag_dc)
      thru_w = strip_dc(thru_w);
    if (flag_df)
      thru_w = interpolated(thru_w, f);
  } else {
    if (has_dc_point(thru_w.freq))
      thru_w = strip_dc(thru_w);
    thru_w = interpolated(thru_w, f);
    add_diagnostic(DiagnosticKind::GridInterpolated,
                   "2x-thru does not share the fixture-DUT-fixture frequency "
                   "grid; it was interpolated.",
                   opts_.verbose);
  }

  // Nyquist rate point: both measurements get the delays of the FDF.
  Eigen::Vector2d td_nrp = Eigen::Vector2d::Zero();
  if (opts_.nrp_enable) {
    td_nrp = td::nyquist_rate_delays(fdf_w);
    fdf_w = td::apply_port_delays(fdf_w, td_nrp);
    thru_w = td::apply_port_delays(thru_w, td_nrp);
  }

  const td::DcSolverOptions dc_opts{opts_.dc_tolerance,
                                    opts_.max_dc_iterations};

  Network leadin1, leadin2;
  if (opts_.leadin > 0) {
    td::PeelResult lead = td::peel_lossless(
        td::shift_points(fdf_w, opts_.leadin), opts_.leadin, opts_.z0, dc_opts);
    leadin1 = td::shift_one_port(lead.left, -opts_.leadin, 0);
    leadin2 = td::shift_one_port(lead.right, -opts_.leadin, 1);
  }

  estimate_gamma(thru_w);

  const int x = td::reference_delay_index(thru_w.trace(1, 0), f);
  const int segments = x - opts_.pullback1;
  if (x <= 0 || segments <= 0) {
    throw UnsupportedCombination(
        "Ieeep370Zc2xThru: 2x-thru delay of " + std::to_string(x) +
        " steps is too short for a pullback of " +
        std::to_string(opts_.pullback1));
  }

  // Each side of the 2x-thru is x segments of length 1/(2x).
  td::PeelResult boxes = td::peel_segments(fdf_w, segments, opts_.z0, gamma_,
                                           1.0 / (2.0 * x), dc_opts);
  Network box1 = boxes.left;
  Network box2 = boxes.right;

  if (opts_.leadin > 0) {
    box1 = cascade(leadin1, box1);
    box2 = cascade(box2, leadin2);
  }
  if (opts_.nrp_enable) {
    box1 = cascade(td::delay_thru(f, -td_nrp(0) / 2.0, opts_.z0), box1);
    box2 = cascade(box2, td::delay_thru(f, -td_nrp(1) / 2.0, opts_.z0));
  }

  if (flag_df) {
    box1 = interpolated(box1, f_stripped);
    box2 = interpolated(box2, f_stripped);
  }
  if (flag_dc) {
    box1 = td::add_dc_point(box1);
    box2 = td::add_dc_point(box2);
    add_diagnostic(DiagnosticKind::DcPointRestored,
                   "DC point of the error boxes interpolated from the lowest "
                   "frequencies.",
                   opts_.verbose);
  }
  if (!same_frequencies(f_fdf, s2xthru.freq)) {
    box1 = interpolated(box1, s2xthru.freq);
    box2 = interpolated(box2, s2xthru.freq);
  }
  box1.name = "side1";
  box2.name = "side2";
  side1_ = box1;
  side2_ = box2;
}

Network Ieeep370Zc2xThru::deembed(const Network &measured) const {
  check_frequencies(measured);
  Network out =
      cascade(cascade(inverse(side1_), measured), inverse(side2_));
  out.name = measured.name;
  return out;
}

} // namespace rfdeembed
