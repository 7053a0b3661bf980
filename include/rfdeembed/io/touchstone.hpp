#pragma once

#include <string>

#include "rfdeembed/network.hpp"

namespace rfdeembed {

enum class TouchstoneFormat { RI, MA, DB };

struct TouchstoneOptions {
  TouchstoneFormat format = TouchstoneFormat::RI;
  int precision = 12;
};

/// ".s<N>p" for an N-port network.
std::string touchstone_extension(int num_ports);

/// Write a network as a Touchstone v1 file. Frequencies are in Hz, the
/// reference impedance is taken from the network. 2-port data is written in
/// the S11 S21 S12 S22 order; larger networks row by row, four values per
/// line.
/// @throws std::runtime_error for an empty network, per-port impedances that
/// differ, or a file that cannot be opened
void write_touchstone(const std::string &path, const Network &net,
                      const TouchstoneOptions &opts = TouchstoneOptions());

} // namespace rfdeembed
