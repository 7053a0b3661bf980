#include "rfdeembed/algebraic.hpp"

#include <vector>

namespace rfdeembed {

namespace {

using Matrices = std::vector<Eigen::MatrixXcd>;

// a - b pointwise.
Matrices subtract(const Matrices &a, const Matrices &b) {
  Matrices out(a.size());
  for (size_t k = 0; k < a.size(); ++k)
    out[k] = a[k] - b[k];
  return out;
}

// Result keeps the measurement's reference impedance and name.
Network remove_admittance(const Network &meas, const Network &open) {
  return from_y(meas.freq, subtract(y_params(meas), y_params(open)), meas.z0,
                meas.name);
}

Network remove_impedance(const Network &meas, const Network &shrt) {
  return from_z(meas.freq, subtract(z_params(meas), z_params(shrt)), meas.z0,
                meas.name);
}

} // namespace

Open::Open(const Network &dummy_open, const std::string &name)
    : Deembedding({dummy_open}, name) {}

Network Open::deembed(const Network &measured) const {
  check_frequencies(measured);
  require_ports(dummies()[0], measured.num_ports(), "Open");
  return remove_admittance(measured, dummies()[0]);
}

Short::Short(const Network &dummy_short, const std::string &name)
    : Deembedding({dummy_short}, name) {}

Network Short::deembed(const Network &measured) const {
  check_frequencies(measured);
  require_ports(dummies()[0], measured.num_ports(), "Short");
  return remove_impedance(measured, dummies()[0]);
}

OpenShort::OpenShort(const Network &dummy_open, const Network &dummy_short,
                     const std::string &name)
    : Deembedding({dummy_open, dummy_short}, name) {}

Network OpenShort::deembed(const Network &measured) const {
  check_frequencies(measured);
  require_ports(dummies()[0], measured.num_ports(), "OpenShort");
  require_ports(dummies()[1], measured.num_ports(), "OpenShort");
  Network step = remove_admittance(measured, dummies()[0]);
  return remove_impedance(step, dummies()[1]);
}

ShortOpen::ShortOpen(const Network &dummy_short, const Network &dummy_open,
                     const std::string &name)
    : Deembedding({dummy_short, dummy_open}, name) {}

Network ShortOpen::deembed(const Network &measured) const {
  check_frequencies(measured);
  require_ports(dummies()[0], measured.num_ports(), "ShortOpen");
  require_ports(dummies()[1], measured.num_ports(), "ShortOpen");
  Network step = remove_impedance(measured, dummies()[0]);
  return remove_admittance(step, dummies()[1]);
}

} // namespace rfdeembed
