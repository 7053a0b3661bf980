#include "rfdeembed/deembedding.hpp"
#include "rfdeembed/errors.hpp"

#include <iostream>
#include <sstream>
#include <utility>

namespace rfdeembed {

const char *to_string(DiagnosticKind kind) {
  switch (kind) {
  case DiagnosticKind::DcPointStripped:
    return "dc-point-stripped";
  case DiagnosticKind::DcPointRestored:
    return "dc-point-restored";
  case DiagnosticKind::NonUniformGrid:
    return "non-uniform-grid";
  case DiagnosticKind::GridInterpolated:
    return "grid-interpolated";
  case DiagnosticKind::NoOutputRequested:
    return "no-output-requested";
  }
  return "unknown";
}

Deembedding::Deembedding(std::vector<Network> dummies, std::string name)
    : dummies_(std::move(dummies)), name_(std::move(name)) {
  if (dummies_.empty()) {
    throw ConfigError("Deembedding: at least one dummy structure is required");
  }
  for (const auto &d : dummies_) {
    if (d.empty()) {
      throw ConfigError("Deembedding: dummy '" + d.name + "' has no data");
    }
    if (!same_frequencies(d.freq, dummies_.front().freq)) {
      throw ConfigError(
          "Deembedding: dummy networks must share the same frequency grid");
    }
  }
}

void Deembedding::check_frequencies(const Network &measured) const {
  if (!same_frequencies(measured.freq, frequencies())) {
    throw FrequencyMismatch(
        "Network frequencies do not match dummy frequencies (" +
        std::to_string(measured.size()) + " vs " +
        std::to_string(frequencies().size()) + " points)");
  }
}

void Deembedding::require_ports(const Network &net, int ports,
                                const char *who) {
  if (net.num_ports() != ports) {
    throw ConfigError(std::string(who) + ": expected a " +
                      std::to_string(ports) + "-port, got " +
                      std::to_string(net.num_ports()) + " ports");
  }
}

void Deembedding::add_diagnostic(DiagnosticKind what,
                                 const std::string &message, bool verbose) {
  if (verbose) {
    std::cerr << kind() << " [" << to_string(what) << "] " << message << "\n";
  }
  diagnostics_.push_back({what, message});
}

std::string Deembedding::describe() const {
  const auto &f = frequencies();
  std::ostringstream oss;
  oss << kind() << " Deembedding: " << name_ << ", " << f.front() << "-"
      << f.back() << " Hz, " << f.size() << " pts, " << dummies_.size()
      << " dummy structures";
  return oss.str();
}

} // namespace rfdeembed
