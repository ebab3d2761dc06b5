#pragma once

// Plain aggregates for configuring the analyzer and collecting its results.
//
// Units: all lengths in metres (SI), powers in watts, angles in radians.

namespace gauss_beam {

// Physical parameters of a single Gaussian beam
struct BeamConfig {
    double wavelength = 1550e-9;     // m (telecom C-band)
    double waist_radius = 5e-6;      // m, 1/e^2 intensity radius at the waist
    double waist_position = 0.0;     // m, axial coordinate of the waist
};

// Centered circular aperture placed in the beam
struct ApertureConfig {
    double incident_power = 1.0;     // W
    double aperture_radius = 10e-6;  // m
    double z = 0.0;                  // m, axial position of the aperture
};

// Single-mode fiber coupling setup.
//
// focal_length > 0 selects coupling through an ideal thin lens, otherwise the
// beam is coupled directly. A zero waist means "use the beam's own waist".
struct FiberCouplingConfig {
    double mode_field_diameter = 10.4e-6; // m (SMF-28 at 1550 nm)
    double waist_x = 0.0;                 // m, direct coupling only
    double waist_y = 0.0;                 // m, direct coupling only (0 = same as waist_x)
    double focal_length = 0.0;            // m
    double incident_waist = 0.0;          // m, lens coupling only
};

// One point of a sampled beam profile
struct BeamSample {
    double z;                   // m
    double radius;              // m
    double radius_of_curvature; // m (infinite at the waist)
    double gouy_phase;          // rad
};

struct ApertureResult {
    double beam_radius;         // beam radius at the aperture plane (m)
    double transmitted_power;   // W
    double transmission;        // transmitted / incident, dimensionless
};

struct CouplingResult {
    double spot_waist_x;        // waist presented to the fiber (m)
    double spot_waist_y;        // m
    double efficiency;          // [0, 1], facet reflection not included
    double loss_db;             // -10 log10(efficiency)
};

} // namespace gauss_beam
