#pragma once

#include <string>
#include <vector>

#include "rfdeembed/network.hpp"

namespace rfdeembed {

/// Category of a non-fatal remediation applied while building a strategy.
enum class DiagnosticKind {
  DcPointStripped,
  DcPointRestored,
  NonUniformGrid,
  GridInterpolated,
  NoOutputRequested
};

struct Diagnostic {
  DiagnosticKind kind;
  std::string message;
};

const char *to_string(DiagnosticKind kind);

/// Base class for fixture removal strategies.
///
/// A strategy is built once from its dummy structures (open, short, thru,
/// 2x-thru, ...), which must share one frequency grid, and is then applied to
/// any number of measurements on that same grid. `deembed` never mutates its
/// input or the stored dummies.
class Deembedding {
public:
  virtual ~Deembedding() = default;

  /// Remove the fixture from a measurement.
  /// @param measured Network sampled on the dummy grid
  /// @return Corrected network with the measured port count and grid
  /// @throws FrequencyMismatch if the grids differ
  virtual Network deembed(const Network &measured) const = 0;

  /// Short label such as "Open" or "IEEEP370Zc2xThru".
  virtual const char *kind() const = 0;

  const std::string &name() const { return name_; }
  const std::vector<double> &frequencies() const { return dummies_.front().freq; }
  const std::vector<Network> &dummies() const { return dummies_; }
  const std::vector<Diagnostic> &diagnostics() const { return diagnostics_; }

  /// One-line summary: kind, name, frequency span and dummy count.
  std::string describe() const;

protected:
  /// @throws ConfigError if the set is empty, a dummy is empty, or the
  /// dummies are not sampled on identical grids
  Deembedding(std::vector<Network> dummies, std::string name);

  /// @throws FrequencyMismatch if `measured` is not on the dummy grid
  void check_frequencies(const Network &measured) const;

  /// @throws ConfigError if `net` has a port count other than `ports`
  static void require_ports(const Network &net, int ports, const char *who);

  void add_diagnostic(DiagnosticKind what, const std::string &message,
                      bool verbose);

private:
  std::vector<Network> dummies_;
  std::string name_;
  std::vector<Diagnostic> diagnostics_;
};

} // namespace rfdeembed
