#pragma once

#include <cmath>
#include "constants.h"

namespace gauss_beam {

/**
 * @brief A fundamental-mode (TEM00) Gaussian beam propagating along z.
 *
 * The beam is described by its wavelength, its waist radius and the axial
 * position of the waist. The Rayleigh length is derived from these and cached;
 * every setter recomputes it before returning, so it is never stale.
 *
 * All lengths are in metres. The formulas are unit-homogeneous, so any
 * self-consistent length unit works as well.
 *
 * Not thread-safe: a beam shared between threads must be guarded by the caller.
 */
class GaussianBeam {
public:
    /**
     * @brief Constructs a Gaussian beam.
     * @param wavelength Vacuum wavelength (m), must be > 0.
     * @param waist_radius 1/e^2 intensity radius at the waist (m), must be > 0.
     * @param waist_position Axial coordinate of the waist (m).
     * @throws std::invalid_argument if wavelength or waist_radius is not positive.
     */
    GaussianBeam(double wavelength, double waist_radius, double waist_position = 0.0);

    // --- Parameters ---
    double get_wavelength() const { return wavelength_; }
    double get_waist_radius() const { return waist_radius_; }
    double get_waist_position() const { return waist_position_; }

    void set_wavelength(double wavelength);
    void set_waist_radius(double waist_radius);
    void set_waist_position(double waist_position);

    /**
     * @brief Rayleigh length z_R = pi * w0^2 / lambda (m).
     * Returns the cached value; nothing is recomputed on read.
     */
    double get_rayleigh_length() const { return rayleigh_length_; }

    // --- Propagation ---

    /**
     * @brief Beam radius w(z) = w0 * sqrt(1 + ((z - z0) / z_R)^2).
     * @param z Axial position (m).
     */
    double beam_radius(double z) const;

    /**
     * @brief Wavefront radius of curvature R(z) = dz * (1 + (z_R / dz)^2).
     * Infinite (planar wavefront) at the waist.
     */
    double radius_of_curvature(double z) const;

    /**
     * @brief Gouy phase psi(z) = atan((z - z0) / z_R) in radians.
     */
    double gouy_phase(double z) const;

    /**
     * @brief Far-field divergence half angle theta = lambda / (pi * w0) in radians.
     */
    double divergence_half_angle() const;

    /**
     * @brief Depth of focus b = 2 * z_R.
     */
    double confocal_parameter() const { return 2.0 * rayleigh_length_; }

    // --- Irradiance and apertures ---

    /**
     * @brief On-axis irradiance I0 = 2P / (pi * w(z)^2) (W/m^2).
     */
    double peak_intensity(double power, double z) const;

    /**
     * @brief Irradiance at radial distance r from the axis (W/m^2).
     */
    double intensity(double power, double r, double z) const;

    /**
     * @brief Power passed by a centered circular aperture.
     *
     * P_t = P * (1 - exp(-2 r^2 / w(z)^2))
     *
     * @param incident_power Power before the aperture (any unit).
     * @param aperture_radius Aperture radius (m), must be >= 0.
     * @param z Axial position of the aperture (m).
     * @return Power behind the aperture, in the unit of incident_power.
     * @throws std::invalid_argument if aperture_radius is negative.
     */
    double aperture_transmitted_power(double incident_power, double aperture_radius, double z) const;

    /**
     * @brief Aperture radius that transmits the given fraction of the power at z.
     * @param fraction Transmitted fraction in [0, 1).
     * @throws std::invalid_argument if fraction is outside [0, 1).
     */
    double aperture_radius_for_transmission(double fraction, double z) const;

    // --- Fiber coupling ---

    /**
     * @brief Overlap coupling efficiency between a Gaussian beam and the
     * fundamental mode of a single-mode fiber.
     *
     * eta = 4 / ((mfd/wx + wx/mfd) * (mfd/wy + wy/mfd))
     *
     * Independent of any beam instance. Fresnel loss at the fiber facet
     * (about 8% for an uncoated facet) is not included.
     *
     * @param mode_field_diameter Fiber mode field diameter (m), must be > 0.
     * @param waist_x Incident waist along x (m), must be > 0.
     * @param waist_y Incident waist along y (m), must be > 0.
     * @return Efficiency in (0, 1]; exactly 1 when wx == wy == mfd.
     * @throws std::invalid_argument on non-positive arguments.
     */
    static double fiber_coupling_efficiency(double mode_field_diameter, double waist_x, double waist_y);

    // Rotationally symmetric beam (waist_y == waist_x)
    static double fiber_coupling_efficiency(double mode_field_diameter, double waist_x);

    /**
     * @brief Waist produced by an ideal thin lens, w_f = 4 lambda f / (pi w_in).
     * @param focal_length Lens focal length (m), must be > 0.
     * @param incident_waist Beam waist at the lens (m), must be > 0.
     */
    double focused_waist(double focal_length, double incident_waist) const;
    double focused_waist(double focal_length) const;

    /**
     * @brief Coupling efficiency into a fiber behind an ideal focusing lens.
     *
     * Same as fiber_coupling_efficiency(mfd, focused_waist(f, w_in)).
     * The overload without incident_waist uses this beam's waist radius.
     */
    double fiber_coupling_efficiency_via_lens(double mode_field_diameter, double focal_length,
                                              double incident_waist) const;
    double fiber_coupling_efficiency_via_lens(double mode_field_diameter, double focal_length) const;

private:
    // Recomputes from the current fields, whichever one changed.
    void update_rayleigh_length();

    double wavelength_;
    double waist_radius_;
    double waist_position_;
    double rayleigh_length_;
};

} // namespace gauss_beam
