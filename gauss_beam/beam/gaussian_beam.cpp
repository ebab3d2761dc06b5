#include "gaussian_beam.h"
#include "constants.h"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace gauss_beam {

namespace {

    void require_positive(double value, const char* name) {
        if (!(value > 0.0)) {
            throw std::invalid_argument(std::string(name) + " must be positive, got " + std::to_string(value));
        }
    }

} // namespace

GaussianBeam::GaussianBeam(double wavelength, double waist_radius, double waist_position)
    : wavelength_(wavelength), waist_radius_(waist_radius), waist_position_(waist_position) {
    require_positive(wavelength_, "wavelength");
    require_positive(waist_radius_, "waist_radius");
    update_rayleigh_length();
}

void GaussianBeam::set_wavelength(double wavelength) {
    require_positive(wavelength, "wavelength");
    wavelength_ = wavelength;
    update_rayleigh_length();
}

void GaussianBeam::set_waist_radius(double waist_radius) {
    require_positive(waist_radius, "waist_radius");
    waist_radius_ = waist_radius;
    update_rayleigh_length();
}

void GaussianBeam::set_waist_position(double waist_position) {
    waist_position_ = waist_position;
    update_rayleigh_length();
}

void GaussianBeam::update_rayleigh_length() {
    // z_R = pi * w0^2 / lambda
    rayleigh_length_ = PI * waist_radius_ * waist_radius_ / wavelength_;
}

double GaussianBeam::beam_radius(double z) const {
    const double ratio = (z - waist_position_) / rayleigh_length_;
    return waist_radius_ * std::sqrt(1.0 + ratio * ratio);
}

double GaussianBeam::radius_of_curvature(double z) const {
    const double dz = z - waist_position_;
    if (dz == 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    const double ratio = rayleigh_length_ / dz;
    return dz * (1.0 + ratio * ratio);
}

double GaussianBeam::gouy_phase(double z) const {
    return std::atan((z - waist_position_) / rayleigh_length_);
}

double GaussianBeam::divergence_half_angle() const {
    return wavelength_ / (PI * waist_radius_);
}

double GaussianBeam::peak_intensity(double power, double z) const {
    const double w = beam_radius(z);
    return 2.0 * power / (PI * w * w);
}

double GaussianBeam::intensity(double power, double r, double z) const {
    const double w = beam_radius(z);
    return peak_intensity(power, z) * std::exp(-2.0 * r * r / (w * w));
}

double GaussianBeam::aperture_transmitted_power(double incident_power, double aperture_radius, double z) const {
    if (aperture_radius < 0.0) {
        throw std::invalid_argument("aperture_radius must be non-negative, got " + std::to_string(aperture_radius));
    }
    const double w = beam_radius(z);
    return incident_power * (1.0 - std::exp(-2.0 * aperture_radius * aperture_radius / (w * w)));
}

double GaussianBeam::aperture_radius_for_transmission(double fraction, double z) const {
    if (!(fraction >= 0.0 && fraction < 1.0)) {
        throw std::invalid_argument("transmission fraction must be in [0, 1), got " + std::to_string(fraction));
    }
    // Inverse of T = 1 - exp(-2 r^2 / w^2)
    return beam_radius(z) * std::sqrt(-std::log(1.0 - fraction) / 2.0);
}

double GaussianBeam::fiber_coupling_efficiency(double mode_field_diameter, double waist_x, double waist_y) {
    require_positive(mode_field_diameter, "mode_field_diameter");
    require_positive(waist_x, "waist_x");
    require_positive(waist_y, "waist_y");

    const double mismatch_x = mode_field_diameter / waist_x + waist_x / mode_field_diameter;
    const double mismatch_y = mode_field_diameter / waist_y + waist_y / mode_field_diameter;
    return 4.0 / (mismatch_x * mismatch_y);
}

double GaussianBeam::fiber_coupling_efficiency(double mode_field_diameter, double waist_x) {
    return fiber_coupling_efficiency(mode_field_diameter, waist_x, waist_x);
}

double GaussianBeam::focused_waist(double focal_length, double incident_waist) const {
    require_positive(focal_length, "focal_length");
    require_positive(incident_waist, "incident_waist");
    return LENS_FOCUS_FACTOR * wavelength_ * focal_length / (PI * incident_waist);
}

double GaussianBeam::focused_waist(double focal_length) const {
    return focused_waist(focal_length, waist_radius_);
}

double GaussianBeam::fiber_coupling_efficiency_via_lens(double mode_field_diameter, double focal_length,
                                                        double incident_waist) const {
    return fiber_coupling_efficiency(mode_field_diameter, focused_waist(focal_length, incident_waist));
}

double GaussianBeam::fiber_coupling_efficiency_via_lens(double mode_field_diameter, double focal_length) const {
    return fiber_coupling_efficiency_via_lens(mode_field_diameter, focal_length, waist_radius_);
}

} // namespace gauss_beam
