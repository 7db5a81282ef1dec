#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/functional.h>
#include <pybind11/stl.h>

#include "libnumopt/core/outcome.hpp"
#include "libnumopt/math/root_finders.hpp"
#include "libnumopt/opt/golden_section.hpp"
#include "libnumopt/opt/nelder_mead.hpp"
#include "libnumopt/utils/logging.hpp"

namespace py = pybind11;

PYBIND11_MODULE(numoptpy, m) {
    m.doc() = "Iterative root finders and minimizers";

    // --- Result types ---
    py::enum_<numopt::ErrorKind>(m, "ErrorKind")
        .value("NonConvergence",       numopt::ErrorKind::NonConvergence)
        .value("InvalidBracket",       numopt::ErrorKind::InvalidBracket)
        .value("DegenerateDerivative", numopt::ErrorKind::DegenerateDerivative);

    py::class_<numopt::Outcome<double>>(m, "Outcome")
        .def_property_readonly("ok", &numopt::Outcome<double>::ok)
        .def_property_readonly("value", &numopt::Outcome<double>::value)
        .def_property_readonly("kind", &numopt::Outcome<double>::kind)
        .def_property_readonly("message", [](const numopt::Outcome<double>& o) {
            return o.ok() ? std::string() : o.error().message;
        })
        .def("__bool__", &numopt::Outcome<double>::ok)
        .def("__repr__", [](const numopt::Outcome<double>& o) {
            if (o.ok()) {
                return "Outcome{value=" + std::to_string(o.value()) + "}";
            }
            return std::string("Outcome{") + numopt::to_string(o.error().kind) +
                ": " + o.error().message + "}";
        });

    py::register_exception<numopt::SolverError>(m, "SolverError", PyExc_RuntimeError);

    // --- Derivative-based solvers ---
    m.def("newton",
        &numopt::root::newton,
        "Newton's method; returns the last iterate even without convergence",
        py::arg("f"), py::arg("df"), py::arg("x0"),
        py::arg("tol") = 1e-10, py::arg("max_iter") = 100);

    m.def("newton_num",
        &numopt::root::newton_num,
        "Newton's method with a central-difference derivative",
        py::arg("f"), py::arg("x0"),
        py::arg("tol") = 1e-10, py::arg("h") = 1e-6, py::arg("max_iter") = 100);

    m.def("halley",
        &numopt::root::halley,
        "Halley's method",
        py::arg("f"), py::arg("df"), py::arg("d2f"), py::arg("x0"),
        py::arg("tol") = 1e-10, py::arg("max_iter") = 100, py::arg("verbose") = false);

    m.def("halley_num",
        &numopt::root::halley_num,
        "Halley's method with central-difference derivatives",
        py::arg("f"), py::arg("x0"),
        py::arg("tol") = 1e-10, py::arg("h") = 1e-6, py::arg("max_iter") = 100,
        py::arg("verbose") = false);

    // --- Bracketing solvers ---
    m.def("bisection",
        &numopt::root::bisection,
        "Bisection on a sign-change bracket",
        py::arg("f"), py::arg("a"), py::arg("b"), py::arg("tol") = 1e-10);

    m.def("secant",
        &numopt::root::secant,
        "Secant method from two starting estimates",
        py::arg("f"), py::arg("a"), py::arg("b"),
        py::arg("tol") = 1e-10, py::arg("max_iter") = 100);

    m.def("ridder",
        &numopt::root::ridder,
        "Ridder's method on a sign-change bracket",
        py::arg("f"), py::arg("a"), py::arg("b"),
        py::arg("tol") = 1e-10, py::arg("max_iter") = 100);

    // --- Minimizers ---
    m.def("golden_section_minimize",
        &numopt::opt::golden_section_minimize,
        "Golden-section search for the minimum of a unimodal function",
        py::arg("f"), py::arg("a"), py::arg("b"), py::arg("tol") = 1e-10);

    py::class_<numopt::opt::NelderMeadConfig>(m, "NelderMeadConfig")
        .def(py::init<>())
        .def_readwrite("simplex_size", &numopt::opt::NelderMeadConfig::simplex_size)
        .def_readwrite("tol",          &numopt::opt::NelderMeadConfig::tol)
        .def_readwrite("max_iter",     &numopt::opt::NelderMeadConfig::max_iter)
        .def_readwrite("verbose",      &numopt::opt::NelderMeadConfig::verbose);

    py::class_<numopt::opt::NelderMeadResult>(m, "NelderMeadResult")
        .def_readonly("x",          &numopt::opt::NelderMeadResult::x)
        .def_readonly("fx",         &numopt::opt::NelderMeadResult::fx)
        .def_readonly("iterations", &numopt::opt::NelderMeadResult::iterations);

    m.def("nelder_mead",
        py::overload_cast<const numopt::opt::VectorFunction&, const Eigen::VectorXd&,
                          double, double, int, bool>(&numopt::opt::nelder_mead),
        "Nelder-Mead simplex minimization",
        py::arg("f"), py::arg("x0"), py::arg("simplex_size") = 0.1,
        py::arg("tol") = 1e-10, py::arg("max_iter") = 1000, py::arg("verbose") = false);

    m.def("nelder_mead_config",
        py::overload_cast<const numopt::opt::VectorFunction&, const Eigen::VectorXd&,
                          const numopt::opt::NelderMeadConfig&>(&numopt::opt::nelder_mead),
        "Nelder-Mead simplex minimization driven by a NelderMeadConfig",
        py::arg("f"), py::arg("x0"), py::arg("cfg") = numopt::opt::NelderMeadConfig{});

    // --- Logging ---
    m.def("set_log_level",
        [](const std::string& level) {
            numopt::utils::Logging::init(spdlog::level::from_str(level));
        },
        "Set the solver log level (trace, debug, info, warn, err, critical, off)",
        py::arg("level"));
}
