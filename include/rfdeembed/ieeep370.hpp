#pragma once

#include <Eigen/Core>
#include <string>

#include "rfdeembed/deembedding.hpp"
#include "rfdeembed/time_domain.hpp"

namespace rfdeembed {

/// Options for the single-measurement (no impedance correction) split.
struct Nzc2xThruOptions {
  double z0 = 50.0;             ///< Reference impedance of inputs and boxes
  double dc_tolerance = 1e-12;  ///< Causal DC solver tolerance
  int max_dc_iterations = 100;  ///< Causal DC solver iteration cap
  bool verbose = false;         ///< Echo diagnostics to stderr
};

/// IEEE P370 2x-thru split without impedance correction.
///
/// The 2x-thru is cut in the time domain at the transmission delay midpoint:
/// the reflections before the cut belong to side 1 (resp. side 2), and the
/// transmission terms follow from requiring side1 ** side2 == 2x-thru.
/// Works on a uniform grid f_k = k*df; a DC point or a non-uniform grid is
/// handled (but not both at once).
class Ieeep370Nzc2xThru final : public Deembedding {
public:
  /// @throws ConfigError if the 2x-thru is not a 2-port or options are invalid
  /// @throws UnsupportedCombination for a DC point on a non-uniform grid
  Ieeep370Nzc2xThru(const Network &dummy_2xthru, const std::string &name = "",
                    const Nzc2xThruOptions &opts = Nzc2xThruOptions());

  Network deembed(const Network &measured) const override;
  const char *kind() const override { return "IEEEP370Nzc2xThru"; }

  const Network &side1() const { return side1_; }
  const Network &side2() const { return side2_; }
  const Nzc2xThruOptions &options() const { return opts_; }

private:
  void split_2xthru(const Network &s2xthru);

  Nzc2xThruOptions opts_;
  Network side1_;
  Network side2_;
};

/// Options for the two-measurement (impedance corrected) split.
struct Zc2xThruOptions {
  double z0 = 50.0;              ///< Reference impedance of inputs and boxes
  double bandwidth_limit = 0.0;  ///< Fit loss below this frequency (Hz), 0 = off
  int pullback1 = 0;             ///< Segments left in the DUT on side 1
  int pullback2 = 0;             ///< Segments left in the DUT on side 2
  bool side1 = true;             ///< Extract side 1
  bool side2 = true;             ///< Extract side 2
  bool nrp_enable = true;        ///< Enforce the Nyquist rate point
  int leadin = 1;                ///< Lead-in points removed before peeling
  double dc_tolerance = 1e-10;
  int max_dc_iterations = 100;
  bool verbose = false;
};

/// IEEE P370 2x-thru split with impedance correction.
///
/// The error boxes are peeled segment by segment from the
/// fixture-DUT-fixture measurement, each segment sized from the local TDR
/// impedance and propagating with the per-length loss and phase of the
/// 2x-thru. The result therefore follows the impedance of the fixture in the
/// actual DUT measurement rather than the one seen in the 2x-thru.
class Ieeep370Zc2xThru final : public Deembedding {
public:
  /// @throws ConfigError on negative or invalid options, or non-2-port inputs
  /// @throws UnsupportedCombination for asymmetric pullback or single-side
  /// extraction
  Ieeep370Zc2xThru(const Network &dummy_2xthru,
                   const Network &dummy_fix_dut_fix,
                   const std::string &name = "",
                   const Zc2xThruOptions &opts = Zc2xThruOptions());

  Network deembed(const Network &measured) const override;
  const char *kind() const override { return "IEEEP370Zc2xThru"; }

  const Network &side1() const { return side1_; }
  const Network &side2() const { return side2_; }
  const Network &fix_dut_fix() const { return fdf_; }
  const Zc2xThruOptions &options() const { return opts_; }

  /// Propagation constant per unit 2x-thru length, as used for peeling.
  const td::CVec &gamma() const { return gamma_; }

private:
  void validate_options() const;
  void split_2xthru(const Network &s2xthru, const Network &fdf);
  void estimate_gamma(const Network &s2xthru);

  Zc2xThruOptions opts_;
  Network fdf_;
  Network side1_;
  Network side2_;
  td::CVec gamma_;
};

} // namespace rfdeembed
