#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <spdlog/spdlog.h> // For spdlog::set_level
#include <spdlog/common.h> // For spdlog::level::level_enum and spdlog::level::to_string_view

#include "beam/gaussian_beam.h"
#include "beam_analyzer.h"
#include "beam_types.h"
#include "constants.h"

namespace py = pybind11;
using namespace gauss_beam;

// Sets the global spdlog level from Python
void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
    spdlog::info("Global log level set to {}.", spdlog::level::to_string_view(level));
}


PYBIND11_MODULE(_core, m) {
    m.doc() = "gauss_beam - Gaussian beam propagation, aperture and fiber coupling calculations";
    m.attr("__version__") = "0.1.0";

    py::enum_<spdlog::level::level_enum>(m, "LogLevel", "Global logging levels for spdlog.")
        .value("TRACE", spdlog::level::trace)
        .value("DEBUG", spdlog::level::debug)
        .value("INFO", spdlog::level::info)
        .value("WARN", spdlog::level::warn)
        .value("ERROR", spdlog::level::err)
        .value("CRITICAL", spdlog::level::critical)
        .value("OFF", spdlog::level::off)
        .export_values();

    // Configuration structs
    py::class_<BeamConfig>(m, "BeamConfig")
        .def(py::init<>())
        .def_readwrite("wavelength", &BeamConfig::wavelength)
        .def_readwrite("waist_radius", &BeamConfig::waist_radius)
        .def_readwrite("waist_position", &BeamConfig::waist_position);

    py::class_<ApertureConfig>(m, "ApertureConfig")
        .def(py::init<>())
        .def_readwrite("incident_power", &ApertureConfig::incident_power)
        .def_readwrite("aperture_radius", &ApertureConfig::aperture_radius)
        .def_readwrite("z", &ApertureConfig::z);

    py::class_<FiberCouplingConfig>(m, "FiberCouplingConfig")
        .def(py::init<>())
        .def_readwrite("mode_field_diameter", &FiberCouplingConfig::mode_field_diameter)
        .def_readwrite("waist_x", &FiberCouplingConfig::waist_x)
        .def_readwrite("waist_y", &FiberCouplingConfig::waist_y)
        .def_readwrite("focal_length", &FiberCouplingConfig::focal_length)
        .def_readwrite("incident_waist", &FiberCouplingConfig::incident_waist);

    // Results
    py::class_<BeamSample>(m, "BeamSample")
        .def_readonly("z", &BeamSample::z)
        .def_readonly("radius", &BeamSample::radius)
        .def_readonly("radius_of_curvature", &BeamSample::radius_of_curvature)
        .def_readonly("gouy_phase", &BeamSample::gouy_phase);

    py::class_<ApertureResult>(m, "ApertureResult")
        .def_readonly("beam_radius", &ApertureResult::beam_radius)
        .def_readonly("transmitted_power", &ApertureResult::transmitted_power)
        .def_readonly("transmission", &ApertureResult::transmission);

    py::class_<CouplingResult>(m, "CouplingResult")
        .def_readonly("spot_waist_x", &CouplingResult::spot_waist_x)
        .def_readonly("spot_waist_y", &CouplingResult::spot_waist_y)
        .def_readonly("efficiency", &CouplingResult::efficiency)
        .def_readonly("loss_db", &CouplingResult::loss_db);

    // The beam model. Parameters are properties so that assignment from Python
    // goes through the setters and keeps the Rayleigh length current.
    py::class_<GaussianBeam>(m, "GaussianBeam")
        .def(py::init<double, double, double>(),
             py::arg("wavelength"), py::arg("waist_radius"), py::arg("waist_position") = 0.0,
             "Constructs a Gaussian beam. All lengths in metres.")
        .def_property("wavelength", &GaussianBeam::get_wavelength, &GaussianBeam::set_wavelength)
        .def_property("waist_radius", &GaussianBeam::get_waist_radius, &GaussianBeam::set_waist_radius)
        .def_property("waist_position", &GaussianBeam::get_waist_position, &GaussianBeam::set_waist_position)
        .def_property_readonly("rayleigh_length", &GaussianBeam::get_rayleigh_length)
        .def("beam_radius", &GaussianBeam::beam_radius, py::arg("z"))
        .def("radius_of_curvature", &GaussianBeam::radius_of_curvature, py::arg("z"))
        .def("gouy_phase", &GaussianBeam::gouy_phase, py::arg("z"))
        .def("divergence_half_angle", &GaussianBeam::divergence_half_angle)
        .def("confocal_parameter", &GaussianBeam::confocal_parameter)
        .def("peak_intensity", &GaussianBeam::peak_intensity, py::arg("power"), py::arg("z"))
        .def("intensity", &GaussianBeam::intensity, py::arg("power"), py::arg("r"), py::arg("z"))
        .def("aperture_transmitted_power", &GaussianBeam::aperture_transmitted_power,
             py::arg("incident_power"), py::arg("aperture_radius"), py::arg("z"),
             "Power behind a centered circular aperture of the given radius at position z.")
        .def("aperture_radius_for_transmission", &GaussianBeam::aperture_radius_for_transmission,
             py::arg("fraction"), py::arg("z"))
        .def_static("fiber_coupling_efficiency",
                    py::overload_cast<double, double>(&GaussianBeam::fiber_coupling_efficiency),
                    py::arg("mode_field_diameter"), py::arg("waist_x"))
        .def_static("fiber_coupling_efficiency",
                    py::overload_cast<double, double, double>(&GaussianBeam::fiber_coupling_efficiency),
                    py::arg("mode_field_diameter"), py::arg("waist_x"), py::arg("waist_y"),
                    "Theoretical coupling efficiency into a single-mode fiber (facet loss not included).")
        .def("focused_waist",
             py::overload_cast<double>(&GaussianBeam::focused_waist, py::const_),
             py::arg("focal_length"))
        .def("focused_waist",
             py::overload_cast<double, double>(&GaussianBeam::focused_waist, py::const_),
             py::arg("focal_length"), py::arg("incident_waist"))
        .def("fiber_coupling_efficiency_via_lens",
             py::overload_cast<double, double>(&GaussianBeam::fiber_coupling_efficiency_via_lens, py::const_),
             py::arg("mode_field_diameter"), py::arg("focal_length"))
        .def("fiber_coupling_efficiency_via_lens",
             py::overload_cast<double, double, double>(&GaussianBeam::fiber_coupling_efficiency_via_lens, py::const_),
             py::arg("mode_field_diameter"), py::arg("focal_length"), py::arg("incident_waist"));

    py::class_<BeamAnalyzer>(m, "BeamAnalyzer")
        .def(py::init<const BeamConfig&>(), py::arg("config"))
        .def("beam", &BeamAnalyzer::beam, py::return_value_policy::reference_internal)
        .def("set_config", &BeamAnalyzer::set_config, py::arg("config"))
        .def("sample_profile", &BeamAnalyzer::sample_profile,
             py::arg("z_start"), py::arg("z_end"), py::arg("num_samples"))
        .def("analyze_aperture", &BeamAnalyzer::analyze_aperture, py::arg("config"))
        .def("analyze_fiber_coupling", &BeamAnalyzer::analyze_fiber_coupling, py::arg("config"));

    m.def("set_log_level", &set_log_level,
          py::arg("level"),
          "Sets the global logging level. Use LogLevel enum (e.g., gauss_beam.LogLevel.INFO).");

    m.attr("PI") = PI;
}
