#pragma once

#include <string>

#include "rfdeembed/deembedding.hpp"

namespace rfdeembed {

// 2-port fixture removal from a thru made of two mirrored halves.

/// Thru modelled as two mirrored pi-networks. The left half is derived
/// from the thru admittance matrix and the right half is its mirror image.
class SplitPi final : public Deembedding {
public:
  explicit SplitPi(const Network &dummy_thru, const std::string &name = "");
  Network deembed(const Network &measured) const override;
  const char *kind() const override { return "SplitPi"; }

  const Network &left() const { return left_; }
  const Network &right() const { return right_; }

private:
  Network left_;
  Network right_;
};

/// Thru modelled as two mirrored tee-networks, split in the impedance domain.
class SplitTee final : public Deembedding {
public:
  explicit SplitTee(const Network &dummy_thru, const std::string &name = "");
  Network deembed(const Network &measured) const override;
  const char *kind() const override { return "SplitTee"; }

  const Network &left() const { return left_; }
  const Network &right() const { return right_; }

private:
  Network left_;
  Network right_;
};

/// Removes the thru and averages Y of the result with its port-swapped copy.
/// Only valid for DUTs that are symmetric under port exchange.
class AdmittanceCancel final : public Deembedding {
public:
  explicit AdmittanceCancel(const Network &dummy_thru,
                            const std::string &name = "");
  Network deembed(const Network &measured) const override;
  const char *kind() const override { return "AdmittanceCancel"; }
};

/// Same as AdmittanceCancel, averaging in the impedance domain.
class ImpedanceCancel final : public Deembedding {
public:
  explicit ImpedanceCancel(const Network &dummy_thru,
                           const std::string &name = "");
  Network deembed(const Network &measured) const override;
  const char *kind() const override { return "ImpedanceCancel"; }
};

} // namespace rfdeembed
