#pragma once

#include <Eigen/Core>
#include <complex>
#include <vector>

#include "rfdeembed/network.hpp"

namespace rfdeembed {
namespace td {

// Time-domain helpers for band-limited S-parameter traces.
//
// All functions expect a uniform grid f_k = k*df, k = 1..n, without the DC
// sample. The Hermitian extension has even length N = 2n with f_n as its
// Nyquist bin, the time step is dt = 1 / (N*df), and "shifted" sequences put
// t = 0 at index n so that index m holds t = (m - n)*dt. A delay of a whole
// number of time steps is real at f_n; anything else loses the imaginary part
// of its Nyquist sample.

using CVec = std::vector<std::complex<double>>;

/// Stopping rule of the causal DC-point solver.
struct DcSolverOptions {
  double tolerance = 1e-12;
  int max_iterations = 100;
};

/// Length of the extended spectrum for n positive-frequency samples.
inline int extended_length(size_t n) { return 2 * static_cast<int>(n); }

/// Time step of the extended spectrum of grid `f`.
double time_step(const std::vector<double> &f);

/// [dc, s_1..s_{n-1}, Re(s_n), conj(s_{n-1})..conj(s_1)], the spectrum of a
/// real signal.
Eigen::VectorXcd make_symmetric(double dc, const CVec &s);

/// Real impulse response of the Hermitian extension (unshifted).
std::vector<double> impulse_response(double dc, const CVec &s);

/// Spectrum bins 1..n of a real, unshifted sequence of length 2n.
CVec spectrum_of(const std::vector<double> &impulse);

std::vector<double> fftshift(const std::vector<double> &x);
std::vector<double> ifftshift(const std::vector<double> &x);

/// Running sum of an impulse response.
std::vector<double> make_step(const std::vector<double> &impulse);

/// Phase unwrapping: removes jumps larger than pi between neighbours.
std::vector<double> unwrap(const std::vector<double> &phase);

/// Estimate the real DC value of a smooth trace from its first 9 samples,
/// mirrored to negative frequency with conjugate symmetry.
double dc_interp(const CVec &s, const std::vector<double> &f);

/// COM receiver noise filter (IEEE 802.3 eq. 93A-20), f and fr in Hz.
CVec com_receiver_noise_filter(const std::vector<double> &f, double fr);

/// Solve for the DC value that makes the filtered step response vanish 3 ns
/// before t = 0.
/// @throws NonConvergence if `opts.max_iterations` is exhausted
double causal_dc_point(const CVec &s, const std::vector<double> &f,
                       const DcSolverOptions &opts = DcSolverOptions());

/// TDR impedance profile z(t) = -z0 (step + 1) / (step - 1).
std::vector<double> tdr_impedance(const std::vector<double> &step, double z0);

/// Impedance at t = 0 in the TDR of reflection `s`. A half-step segment's
/// far end shows up one time step later.
double port_impedance(const CVec &s, const std::vector<double> &f, double z0,
                      const DcSolverOptions &opts = DcSolverOptions());

/// Delay of the transmission impulse peak, in whole time steps.
int reference_delay_index(const CVec &s21, const std::vector<double> &f);

/// Uniform lossy line of impedance `zline` between `z0` ports; `gamma` is
/// the propagation constant per unit length at every frequency.
Network transmission_line(const std::vector<double> &f, double zline,
                          double z0, const CVec &gamma, double length);

/// Matched thru with transmission exp(-j 2 pi f delay).
Network delay_thru(const std::vector<double> &f, double delay, double z0);

/// Delay both ports by N/2 time steps (N steps round trip). Negative N
/// advances.
Network shift_points(const Network &net, int N);

/// Delay a single port by N/2 time steps. Port 0 is prepended, port 1
/// appended.
Network shift_one_port(const Network &net, int N, int port);

/// Result of stripping line segments from both ends of a network.
struct PeelResult {
  Network residual;
  Network left;  ///< side 1 segments, outermost first
  Network right; ///< side 2 segments, innermost first
};

/// Strip `count` line segments of the given propagation from each side.
/// Every segment takes the impedance the residual shows one time step into
/// its TDR at that port.
PeelResult peel_segments(const Network &net, int count, double z0,
                         const CVec &gamma, double length,
                         const DcSolverOptions &opts = DcSolverOptions());

/// peel_segments with lossless half-step segments, gamma*l = j*pi*f*dt.
PeelResult peel_lossless(const Network &net, int N, double z0,
                         const DcSolverOptions &opts = DcSolverOptions());

/// Copy of `net` with a DC sample prepended, each element estimated with
/// dc_interp.
Network add_dc_point(const Network &net);

/// Per-port delays that bring arg S_ii at the last frequency to 0 or pi.
/// A port whose S_ii there is at rounding level has no phase to align and
/// gets no delay.
Eigen::Vector2d nyquist_rate_delays(const Network &net);

/// delay_thru(td0/2) ** net ** delay_thru(td1/2).
Network apply_port_delays(const Network &net, const Eigen::Vector2d &td);

} // namespace td
} // namespace rfdeembed
