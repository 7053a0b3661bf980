#pragma once

#include <string>

#include "rfdeembed/deembedding.hpp"

namespace rfdeembed {

// Lumped parasitic subtraction for n-port measurements. The subtraction
// order encodes the assumed fixture topology and is not validated.

/// Remove shunt pad parasitics: Y = Y_meas - Y_open.
class Open final : public Deembedding {
public:
  Open(const Network &dummy_open, const std::string &name = "");
  Network deembed(const Network &measured) const override;
  const char *kind() const override { return "Open"; }
};

/// Remove series lead parasitics: Z = Z_meas - Z_short.
class Short final : public Deembedding {
public:
  Short(const Network &dummy_short, const std::string &name = "");
  Network deembed(const Network &measured) const override;
  const char *kind() const override { return "Short"; }
};

/// Shunt pads outside series leads: subtract Y_open, then Z_short.
class OpenShort final : public Deembedding {
public:
  OpenShort(const Network &dummy_open, const Network &dummy_short,
            const std::string &name = "");
  Network deembed(const Network &measured) const override;
  const char *kind() const override { return "OpenShort"; }
};

/// Series leads outside shunt pads: subtract Z_short, then Y_open.
class ShortOpen final : public Deembedding {
public:
  ShortOpen(const Network &dummy_short, const Network &dummy_open,
            const std::string &name = "");
  Network deembed(const Network &measured) const override;
  const char *kind() const override { return "ShortOpen"; }
};

} // namespace rfdeembed
