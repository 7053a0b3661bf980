#include <pybind11/complex.h>
#include <pybind11/eigen.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "rfdeembed/algebraic.hpp"
#include "rfdeembed/errors.hpp"
#include "rfdeembed/ieeep370.hpp"
#include "rfdeembed/io/touchstone.hpp"
#include "rfdeembed/mirror.hpp"
#include "rfdeembed/network.hpp"

namespace py = pybind11;
using namespace rfdeembed;

PYBIND11_MODULE(pyrfdeembed, m) {
  m.doc() = "Python bindings for the rfdeembed fixture removal library.";

  py::register_exception<ConfigError>(m, "ConfigError", PyExc_ValueError);
  py::register_exception<FrequencyMismatch>(m, "FrequencyMismatch",
                                            PyExc_ValueError);
  py::register_exception<UnsupportedCombination>(m, "UnsupportedCombination",
                                                 PyExc_NotImplementedError);
  py::register_exception<NonConvergence>(m, "NonConvergence",
                                         PyExc_RuntimeError);

  py::class_<Network>(m, "Network", "Frequency-sampled S-parameter network.")
      .def(py::init<>())
      .def_readwrite("freq", &Network::freq, "Frequencies in Hz.")
      .def_readwrite("s", &Network::s, "S-matrix per frequency.")
      .def_readwrite("z0", &Network::z0, "Reference impedance per port.")
      .def_readwrite("name", &Network::name)
      .def("num_ports", &Network::num_ports)
      .def("trace", &Network::trace, py::arg("i"), py::arg("j"))
      .def("__len__", &Network::size);

  m.def("make_network", &make_network, "Build a network with uniform z0.",
        py::arg("freq"), py::arg("s"), py::arg("z0") = 50.0,
        py::arg("name") = "");
  m.def("z_params", &z_params, py::arg("net"));
  m.def("y_params", &y_params, py::arg("net"));
  m.def("cascade", &cascade, "Connect port 2 of a to port 1 of b.",
        py::arg("a"), py::arg("b"));
  m.def("inverse", &inverse, py::arg("net"));
  m.def("flipped", &flipped, py::arg("net"));
  m.def("renormalized",
        py::overload_cast<const Network &, double>(&renormalized),
        py::arg("net"), py::arg("z0"));
  m.def("interpolated", &interpolated, py::arg("net"), py::arg("freq"));
  m.def("ideal_thru", &ideal_thru, py::arg("freq"), py::arg("z0") = 50.0);

  py::enum_<DiagnosticKind>(m, "DiagnosticKind")
      .value("DcPointStripped", DiagnosticKind::DcPointStripped)
      .value("DcPointRestored", DiagnosticKind::DcPointRestored)
      .value("NonUniformGrid", DiagnosticKind::NonUniformGrid)
      .value("GridInterpolated", DiagnosticKind::GridInterpolated)
      .value("NoOutputRequested", DiagnosticKind::NoOutputRequested);

  py::class_<Diagnostic>(m, "Diagnostic")
      .def_readonly("kind", &Diagnostic::kind)
      .def_readonly("message", &Diagnostic::message);

  py::class_<Deembedding>(m, "Deembedding", "Fixture removal strategy.")
      .def("deembed", &Deembedding::deembed, py::arg("measured"))
      .def_property_readonly("name", &Deembedding::name)
      .def_property_readonly("frequencies", &Deembedding::frequencies)
      .def_property_readonly("diagnostics", &Deembedding::diagnostics)
      .def("__str__", &Deembedding::describe);

  py::class_<Open, Deembedding>(m, "Open")
      .def(py::init<const Network &, const std::string &>(),
           py::arg("dummy_open"), py::arg("name") = "");
  py::class_<Short, Deembedding>(m, "Short")
      .def(py::init<const Network &, const std::string &>(),
           py::arg("dummy_short"), py::arg("name") = "");
  py::class_<OpenShort, Deembedding>(m, "OpenShort")
      .def(py::init<const Network &, const Network &, const std::string &>(),
           py::arg("dummy_open"), py::arg("dummy_short"), py::arg("name") = "");
  py::class_<ShortOpen, Deembedding>(m, "ShortOpen")
      .def(py::init<const Network &, const Network &, const std::string &>(),
           py::arg("dummy_short"), py::arg("dummy_open"), py::arg("name") = "");

  py::class_<SplitPi, Deembedding>(m, "SplitPi")
      .def(py::init<const Network &, const std::string &>(),
           py::arg("dummy_thru"), py::arg("name") = "");
  py::class_<SplitTee, Deembedding>(m, "SplitTee")
      .def(py::init<const Network &, const std::string &>(),
           py::arg("dummy_thru"), py::arg("name") = "");
  py::class_<AdmittanceCancel, Deembedding>(m, "AdmittanceCancel")
      .def(py::init<const Network &, const std::string &>(),
           py::arg("dummy_thru"), py::arg("name") = "");
  py::class_<ImpedanceCancel, Deembedding>(m, "ImpedanceCancel")
      .def(py::init<const Network &, const std::string &>(),
           py::arg("dummy_thru"), py::arg("name") = "");

  py::class_<Nzc2xThruOptions>(m, "Nzc2xThruOptions")
      .def(py::init<>())
      .def_readwrite("z0", &Nzc2xThruOptions::z0)
      .def_readwrite("dc_tolerance", &Nzc2xThruOptions::dc_tolerance)
      .def_readwrite("max_dc_iterations", &Nzc2xThruOptions::max_dc_iterations)
      .def_readwrite("verbose", &Nzc2xThruOptions::verbose);

  py::class_<Ieeep370Nzc2xThru, Deembedding>(m, "IEEEP370_SE_NZC_2xThru")
      .def(py::init<const Network &, const std::string &,
                    const Nzc2xThruOptions &>(),
           py::arg("dummy_2xthru"), py::arg("name") = "",
           py::arg("opts") = Nzc2xThruOptions())
      .def_property_readonly("s_side1", &Ieeep370Nzc2xThru::side1)
      .def_property_readonly("s_side2", &Ieeep370Nzc2xThru::side2);

  py::class_<Zc2xThruOptions>(m, "Zc2xThruOptions")
      .def(py::init<>())
      .def_readwrite("z0", &Zc2xThruOptions::z0)
      .def_readwrite("bandwidth_limit", &Zc2xThruOptions::bandwidth_limit)
      .def_readwrite("pullback1", &Zc2xThruOptions::pullback1)
      .def_readwrite("pullback2", &Zc2xThruOptions::pullback2)
      .def_readwrite("side1", &Zc2xThruOptions::side1)
      .def_readwrite("side2", &Zc2xThruOptions::side2)
      .def_readwrite("nrp_enable", &Zc2xThruOptions::nrp_enable)
      .def_readwrite("leadin", &Zc2xThruOptions::leadin)
      .def_readwrite("dc_tolerance", &Zc2xThruOptions::dc_tolerance)
      .def_readwrite("max_dc_iterations", &Zc2xThruOptions::max_dc_iterations)
      .def_readwrite("verbose", &Zc2xThruOptions::verbose);

  py::class_<Ieeep370Zc2xThru, Deembedding>(m, "IEEEP370_SE_ZC_2xThru")
      .def(py::init<const Network &, const Network &, const std::string &,
                    const Zc2xThruOptions &>(),
           py::arg("dummy_2xthru"), py::arg("dummy_fix_dut_fix"),
           py::arg("name") = "", py::arg("opts") = Zc2xThruOptions())
      .def_property_readonly("s_side1", &Ieeep370Zc2xThru::side1)
      .def_property_readonly("s_side2", &Ieeep370Zc2xThru::side2);

  py::enum_<TouchstoneFormat>(m, "TouchstoneFormat")
      .value("RI", TouchstoneFormat::RI, "Real/Imaginary format")
      .value("MA", TouchstoneFormat::MA, "Magnitude/Angle format")
      .value("DB", TouchstoneFormat::DB, "dB/Angle format");

  py::class_<TouchstoneOptions>(m, "TouchstoneOptions",
                                "Options for Touchstone export.")
      .def(py::init<>())
      .def_readwrite("format", &TouchstoneOptions::format)
      .def_readwrite("precision", &TouchstoneOptions::precision);

  m.def("write_touchstone", &write_touchstone,
        "Writes a network to a Touchstone file.", py::arg("path"),
        py::arg("net"), py::arg("opts") = TouchstoneOptions());
  m.def("touchstone_extension", &touchstone_extension,
        "Get appropriate Touchstone file extension for given port count.",
        py::arg("num_ports"));
}
