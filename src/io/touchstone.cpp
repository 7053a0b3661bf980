#include "rfdeembed/io/touchstone.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <string>

namespace rfdeembed {

namespace {

const char *format_name(TouchstoneFormat format) {
  switch (format) {
  case TouchstoneFormat::MA:
    return "MA";
  case TouchstoneFormat::DB:
    return "DB";
  case TouchstoneFormat::RI:
    break;
  }
  return "RI";
}

void write_value(std::ofstream &ofs, const std::complex<double> &v,
                 TouchstoneFormat format) {
  const double deg = std::arg(v) * 180.0 / M_PI;
  switch (format) {
  case TouchstoneFormat::RI:
    ofs << ' ' << v.real() << ' ' << v.imag();
    break;
  case TouchstoneFormat::MA:
    ofs << ' ' << std::abs(v) << ' ' << deg;
    break;
  case TouchstoneFormat::DB:
    ofs << ' ' << 20.0 * std::log10(std::max(std::abs(v), 1e-20)) << ' '
        << deg;
    break;
  }
}

} // namespace

std::string touchstone_extension(int num_ports) {
  return ".s" + std::to_string(num_ports) + "p";
}

void write_touchstone(const std::string &path, const Network &net,
                      const TouchstoneOptions &opts) {
  if (net.empty()) {
    throw std::runtime_error("write_touchstone: network has no data");
  }
  if (net.s.size() != net.freq.size()) {
    throw std::runtime_error(
        "write_touchstone: frequency and S-matrix counts differ");
  }
  const int p = net.num_ports();
  for (int i = 1; i < p; ++i) {
    if (std::abs(net.z0(i) - net.z0(0)) > 1e-12 * net.z0(0)) {
      throw std::runtime_error(
          "write_touchstone: per-port reference impedances must be equal");
    }
  }

  std::ofstream ofs(path);
  if (!ofs) {
    throw std::runtime_error("write_touchstone: cannot open " + path);
  }
  ofs << "! " << (net.name.empty() ? "network" : net.name) << "\n";
  ofs << "! " << p << "-port S-parameters, " << net.size() << " points\n";
  ofs << "# Hz S " << format_name(opts.format) << " R " << net.z0(0) << "\n";
  ofs << std::setprecision(opts.precision);

  for (size_t k = 0; k < net.size(); ++k) {
    const Eigen::MatrixXcd &S = net.s[k];
    ofs << net.freq[k];
    if (p == 2) {
      write_value(ofs, S(0, 0), opts.format);
      write_value(ofs, S(1, 0), opts.format);
      write_value(ofs, S(0, 1), opts.format);
      write_value(ofs, S(1, 1), opts.format);
      ofs << '\n';
      continue;
    }
    for (int i = 0; i < p; ++i) {
      for (int j = 0; j < p; ++j) {
        if (j > 0 && j % 4 == 0)
          ofs << "\n";
        write_value(ofs, S(i, j), opts.format);
      }
      ofs << '\n';
    }
  }
}

} // namespace rfdeembed
