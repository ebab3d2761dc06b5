#include <gtest/gtest.h>
#include "beam/gaussian_beam.h"
#include "constants.h"
#include <cmath>
#include <limits>
#include <stdexcept>

using gauss_beam::GaussianBeam;
using gauss_beam::PI;

namespace {

double expected_rayleigh_length(double wavelength, double waist) {
    return PI * waist * waist / wavelength;
}

} // namespace

// Reference beam: 1550 nm, 5 um waist
TEST(GaussianBeamTest, RayleighLengthReferenceBeam) {
    GaussianBeam beam(1550e-9, 5e-6);

    EXPECT_DOUBLE_EQ(beam.get_rayleigh_length(), expected_rayleigh_length(1550e-9, 5e-6));
    EXPECT_NEAR(beam.get_rayleigh_length(), 5.0671e-5, 1e-8);
    EXPECT_DOUBLE_EQ(beam.get_waist_position(), 0.0);
}

// Every setter leaves the cached Rayleigh length consistent
TEST(GaussianBeamTest, RayleighLengthFollowsSetters) {
    GaussianBeam beam(633e-9, 0.5e-3, 0.1);

    beam.set_wavelength(1064e-9);
    EXPECT_DOUBLE_EQ(beam.get_rayleigh_length(), expected_rayleigh_length(1064e-9, 0.5e-3));

    beam.set_waist_radius(2e-3);
    EXPECT_DOUBLE_EQ(beam.get_rayleigh_length(), expected_rayleigh_length(1064e-9, 2e-3));

    // Moving the waist does not change z_R
    const double before = beam.get_rayleigh_length();
    beam.set_waist_position(-3.0);
    EXPECT_DOUBLE_EQ(beam.get_rayleigh_length(), before);
    EXPECT_DOUBLE_EQ(beam.get_waist_position(), -3.0);
}

// Beam radius is w0 at the waist and w0*sqrt(2) one Rayleigh length away
TEST(GaussianBeamTest, BeamRadiusAtWaistAndRayleighLength) {
    GaussianBeam beam(1550e-9, 5e-6);
    const double z_r = beam.get_rayleigh_length();

    EXPECT_EQ(beam.beam_radius(0.0), 5e-6);
    EXPECT_DOUBLE_EQ(beam.beam_radius(z_r), 5e-6 * std::sqrt(2.0));
    EXPECT_NEAR(beam.beam_radius(z_r), 7.071e-6, 1e-9);

    GaussianBeam shifted(800e-9, 20e-6, 0.25);
    EXPECT_EQ(shifted.beam_radius(0.25), 20e-6);
}

// Radius is symmetric about the waist and grows away from it
TEST(GaussianBeamTest, BeamRadiusSymmetryAndMonotonicity) {
    GaussianBeam beam(1064e-9, 50e-6, 0.02);
    const double z0 = beam.get_waist_position();

    for (double z : {-0.5, -0.01, 0.0, 0.019, 0.3, 2.0}) {
        EXPECT_DOUBLE_EQ(beam.beam_radius(z), beam.beam_radius(2.0 * z0 - z)) << "z = " << z;
    }

    double previous = beam.beam_radius(z0);
    for (int i = 1; i <= 20; ++i) {
        const double r = beam.beam_radius(z0 + i * 0.01);
        EXPECT_GT(r, previous);
        EXPECT_GE(r, beam.get_waist_radius());
        previous = r;
    }
}

// Far from the waist the radius approaches the asymptotic cone w0 * |dz| / z_R
TEST(GaussianBeamTest, FarFieldDivergence) {
    GaussianBeam beam(1550e-9, 5e-6);

    EXPECT_DOUBLE_EQ(beam.divergence_half_angle(), 1550e-9 / (PI * 5e-6));

    const double z = 1000.0 * beam.get_rayleigh_length();
    EXPECT_NEAR(beam.beam_radius(z) / z, beam.divergence_half_angle(), 1e-6 * beam.divergence_half_angle());
    EXPECT_DOUBLE_EQ(beam.confocal_parameter(), 2.0 * beam.get_rayleigh_length());
}

// Wavefront curvature is planar at the waist and minimal at z_R
TEST(GaussianBeamTest, RadiusOfCurvature) {
    GaussianBeam beam(1550e-9, 5e-6, 1e-3);
    const double z_r = beam.get_rayleigh_length();

    EXPECT_TRUE(std::isinf(beam.radius_of_curvature(1e-3)));
    EXPECT_NEAR(beam.radius_of_curvature(1e-3 + z_r), 2.0 * z_r, 1e-12);
    EXPECT_NEAR(beam.radius_of_curvature(1e-3 - z_r), -2.0 * z_r, 1e-12);
    EXPECT_GT(beam.radius_of_curvature(1e-3 + 5.0 * z_r), 2.0 * z_r);
}

TEST(GaussianBeamTest, GouyPhase) {
    GaussianBeam beam(1550e-9, 5e-6);
    const double z_r = beam.get_rayleigh_length();

    EXPECT_DOUBLE_EQ(beam.gouy_phase(0.0), 0.0);
    EXPECT_NEAR(beam.gouy_phase(z_r), PI / 4.0, 1e-12);
    EXPECT_NEAR(beam.gouy_phase(-z_r), -PI / 4.0, 1e-12);
    EXPECT_LT(beam.gouy_phase(1e6 * z_r), PI / 2.0);
}

// Irradiance integrates to the aperture formula and peaks on axis
TEST(GaussianBeamTest, Intensity) {
    GaussianBeam beam(633e-9, 0.4e-3);
    const double power = 5e-3;

    EXPECT_DOUBLE_EQ(beam.peak_intensity(power, 0.0), 2.0 * power / (PI * 0.4e-3 * 0.4e-3));
    EXPECT_DOUBLE_EQ(beam.intensity(power, 0.0, 0.0), beam.peak_intensity(power, 0.0));

    // At r = w the irradiance has fallen to 1/e^2
    EXPECT_NEAR(beam.intensity(power, 0.4e-3, 0.0) / beam.peak_intensity(power, 0.0),
                std::exp(-2.0), 1e-12);
}

// Reference aperture: r = 10 um at the waist of the 5 um beam passes 1 - e^-8
TEST(GaussianBeamTest, ApertureTransmittedPowerReference) {
    GaussianBeam beam(1550e-9, 5e-6);

    const double transmitted = beam.aperture_transmitted_power(1.0, 1e-5, 0.0);
    EXPECT_DOUBLE_EQ(transmitted, 1.0 - std::exp(-8.0));
    EXPECT_NEAR(transmitted, 0.99966, 1e-5);
}

// Closed aperture passes nothing, very large aperture passes everything
TEST(GaussianBeamTest, ApertureLimits) {
    GaussianBeam beam(1550e-9, 5e-6);
    const double power = 2.5;
    const double z = 3e-4;

    EXPECT_EQ(beam.aperture_transmitted_power(power, 0.0, z), 0.0);
    EXPECT_NEAR(beam.aperture_transmitted_power(power, 1.0, z), power, 1e-12);

    double previous = 0.0;
    for (int i = 1; i <= 30; ++i) {
        const double p = beam.aperture_transmitted_power(power, i * 2e-6, z);
        EXPECT_GT(p, previous);
        EXPECT_LE(p, power);
        previous = p;
    }
}

// Power scales linearly with the incident power
TEST(GaussianBeamTest, AperturePowerScaling) {
    GaussianBeam beam(1064e-9, 1e-3);

    const double p1 = beam.aperture_transmitted_power(1.0, 0.8e-3, 0.5);
    const double p2 = beam.aperture_transmitted_power(2.0, 0.8e-3, 0.5);
    EXPECT_DOUBLE_EQ(p2 / p1, 2.0);
}

// Sizing an aperture inverts the transmission formula
TEST(GaussianBeamTest, ApertureRadiusForTransmission) {
    GaussianBeam beam(1550e-9, 5e-6);
    const double z = 2e-4;

    EXPECT_EQ(beam.aperture_radius_for_transmission(0.0, z), 0.0);

    for (double fraction : {0.1, 0.5, 0.865, 0.99}) {
        const double r = beam.aperture_radius_for_transmission(fraction, z);
        EXPECT_NEAR(beam.aperture_transmitted_power(1.0, r, z), fraction, 1e-12);
    }

    // r = w transmits 1 - e^-2
    EXPECT_NEAR(beam.aperture_radius_for_transmission(1.0 - std::exp(-2.0), z), beam.beam_radius(z), 1e-15);

    EXPECT_THROW(beam.aperture_radius_for_transmission(1.0, z), std::invalid_argument);
    EXPECT_THROW(beam.aperture_radius_for_transmission(-0.1, z), std::invalid_argument);
    EXPECT_THROW(beam.aperture_radius_for_transmission(std::numeric_limits<double>::quiet_NaN(), z),
                 std::invalid_argument);
}

// Matched waist and mode field diameter couple perfectly
TEST(GaussianBeamTest, FiberCouplingMatched) {
    EXPECT_EQ(GaussianBeam::fiber_coupling_efficiency(10.4e-6, 10.4e-6), 1.0);
    EXPECT_EQ(GaussianBeam::fiber_coupling_efficiency(10.4e-6, 10.4e-6, 10.4e-6), 1.0);
}

// Mismatch in either direction, or along either axis, reduces efficiency
TEST(GaussianBeamTest, FiberCouplingMismatch) {
    const double mfd = 10.4e-6;

    const double smaller = GaussianBeam::fiber_coupling_efficiency(mfd, 0.5 * mfd);
    const double larger = GaussianBeam::fiber_coupling_efficiency(mfd, 2.0 * mfd);
    EXPECT_GT(smaller, 0.0);
    EXPECT_LT(smaller, 1.0);
    EXPECT_DOUBLE_EQ(smaller, larger);  // symmetric in w/mfd <-> mfd/w
    EXPECT_DOUBLE_EQ(smaller, 4.0 / (2.5 * 2.5));

    const double astigmatic = GaussianBeam::fiber_coupling_efficiency(mfd, mfd, 2.0 * mfd);
    EXPECT_DOUBLE_EQ(astigmatic, 4.0 / (2.0 * 2.5));
    EXPECT_DOUBLE_EQ(astigmatic, GaussianBeam::fiber_coupling_efficiency(mfd, 2.0 * mfd, mfd));

    // Symmetric overload equals waist_y == waist_x
    EXPECT_DOUBLE_EQ(GaussianBeam::fiber_coupling_efficiency(mfd, 7e-6),
                     GaussianBeam::fiber_coupling_efficiency(mfd, 7e-6, 7e-6));
}

// Coupling through a lens is the direct formula applied to the focused waist
TEST(GaussianBeamTest, FiberCouplingViaLens) {
    const double wavelength = 1550e-9;
    GaussianBeam beam(wavelength, 1.05e-3);
    const double mfd = 10.4e-6;

    for (double f : {4.5e-3, 11e-3, 18.4e-3}) {
        for (double w_in : {0.5e-3, 1.05e-3, 2e-3}) {
            const double focused = 4.0 * wavelength * f / (PI * w_in);
            EXPECT_DOUBLE_EQ(beam.focused_waist(f, w_in), focused);
            EXPECT_DOUBLE_EQ(beam.fiber_coupling_efficiency_via_lens(mfd, f, w_in),
                             GaussianBeam::fiber_coupling_efficiency(mfd, focused));
        }
    }

    // Default incident waist is the beam's own waist
    EXPECT_DOUBLE_EQ(beam.fiber_coupling_efficiency_via_lens(mfd, 11e-3),
                     beam.fiber_coupling_efficiency_via_lens(mfd, 11e-3, 1.05e-3));
    EXPECT_DOUBLE_EQ(beam.focused_waist(11e-3), beam.focused_waist(11e-3, 1.05e-3));
}

// Via-lens coupling picks up changes made through the setters
TEST(GaussianBeamTest, FiberCouplingViaLensTracksBeamState) {
    GaussianBeam beam(1550e-9, 1e-3);
    const double before = beam.fiber_coupling_efficiency_via_lens(10.4e-6, 11e-3);

    beam.set_wavelength(1310e-9);
    beam.set_waist_radius(0.8e-3);
    const double focused = 4.0 * 1310e-9 * 11e-3 / (PI * 0.8e-3);
    EXPECT_DOUBLE_EQ(beam.fiber_coupling_efficiency_via_lens(10.4e-6, 11e-3),
                     GaussianBeam::fiber_coupling_efficiency(10.4e-6, focused));
    EXPECT_NE(beam.fiber_coupling_efficiency_via_lens(10.4e-6, 11e-3), before);
}

// Non-physical parameters are rejected up front
TEST(GaussianBeamTest, RejectsInvalidParameters) {
    EXPECT_THROW(GaussianBeam(0.0, 5e-6), std::invalid_argument);
    EXPECT_THROW(GaussianBeam(1550e-9, -5e-6), std::invalid_argument);
    EXPECT_THROW(GaussianBeam(std::numeric_limits<double>::quiet_NaN(), 5e-6), std::invalid_argument);

    GaussianBeam beam(1550e-9, 5e-6);
    EXPECT_THROW(beam.set_wavelength(-1.0), std::invalid_argument);
    EXPECT_THROW(beam.set_waist_radius(0.0), std::invalid_argument);

    // A rejected setter leaves the beam unchanged
    EXPECT_DOUBLE_EQ(beam.get_wavelength(), 1550e-9);
    EXPECT_DOUBLE_EQ(beam.get_waist_radius(), 5e-6);
    EXPECT_DOUBLE_EQ(beam.get_rayleigh_length(), expected_rayleigh_length(1550e-9, 5e-6));

    EXPECT_THROW(beam.aperture_transmitted_power(1.0, -1e-6, 0.0), std::invalid_argument);
    EXPECT_THROW(GaussianBeam::fiber_coupling_efficiency(0.0, 5e-6), std::invalid_argument);
    EXPECT_THROW(GaussianBeam::fiber_coupling_efficiency(10.4e-6, 5e-6, -1.0), std::invalid_argument);
    EXPECT_THROW(beam.fiber_coupling_efficiency_via_lens(10.4e-6, 0.0), std::invalid_argument);
    EXPECT_THROW(beam.focused_waist(11e-3, 0.0), std::invalid_argument);
}
