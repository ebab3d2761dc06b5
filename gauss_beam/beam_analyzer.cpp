#include "beam_analyzer.h"
#include <spdlog/spdlog.h>
#include <cmath>
#include <stdexcept>

namespace gauss_beam {

BeamAnalyzer::BeamAnalyzer(const BeamConfig& config)
    : beam_(config.wavelength, config.waist_radius, config.waist_position) {
    spdlog::info("Beam created: wavelength {} m, waist {} m at z = {} m",
                 config.wavelength, config.waist_radius, config.waist_position);
    spdlog::info("   Rayleigh length: {} m", beam_.get_rayleigh_length());
    spdlog::info("   Divergence half angle: {} rad", beam_.divergence_half_angle());
}

void BeamAnalyzer::set_config(const BeamConfig& config) {
    // Validate on a copy so a bad config leaves the current beam intact.
    GaussianBeam updated = beam_;
    updated.set_wavelength(config.wavelength);
    updated.set_waist_radius(config.waist_radius);
    updated.set_waist_position(config.waist_position);
    beam_ = updated;

    spdlog::info("Beam reconfigured: wavelength {} m, waist {} m at z = {} m (z_R = {} m)",
                 config.wavelength, config.waist_radius, config.waist_position,
                 beam_.get_rayleigh_length());
}

std::vector<BeamSample> BeamAnalyzer::sample_profile(double z_start, double z_end, int num_samples) const {
    if (num_samples < 2) {
        throw std::invalid_argument("Beam profile needs at least 2 samples.");
    }
    if (!(z_end > z_start)) {
        throw std::invalid_argument("Beam profile range must satisfy z_end > z_start.");
    }

    std::vector<BeamSample> samples;
    samples.reserve(num_samples);

    const double step = (z_end - z_start) / (num_samples - 1);
    for (int i = 0; i < num_samples; ++i) {
        // Pin the last sample to z_end instead of accumulating the step.
        const double z = (i == num_samples - 1) ? z_end : z_start + i * step;
        samples.push_back({z, beam_.beam_radius(z), beam_.radius_of_curvature(z), beam_.gouy_phase(z)});
    }

    spdlog::debug("Sampled beam profile: {} points over [{}, {}] m", num_samples, z_start, z_end);
    return samples;
}

ApertureResult BeamAnalyzer::analyze_aperture(const ApertureConfig& config) const {
    if (config.incident_power < 0.0) {
        spdlog::warn("Negative incident power ({} W) passed to aperture analysis.", config.incident_power);
    }

    ApertureResult result;
    result.beam_radius = beam_.beam_radius(config.z);
    result.transmitted_power =
        beam_.aperture_transmitted_power(config.incident_power, config.aperture_radius, config.z);
    result.transmission = (config.incident_power != 0.0)
        ? result.transmitted_power / config.incident_power
        : beam_.aperture_transmitted_power(1.0, config.aperture_radius, config.z);

    spdlog::info("Aperture r = {} m at z = {} m", config.aperture_radius, config.z);
    spdlog::info("   Beam radius: {} m", result.beam_radius);
    spdlog::info("   Transmitted power: {} W ({:.4f} %)", result.transmitted_power, result.transmission * 100.0);
    return result;
}

CouplingResult BeamAnalyzer::analyze_fiber_coupling(const FiberCouplingConfig& config) const {
    CouplingResult result;

    // Only an exact zero selects a default; anything else is validated by the beam.
    if (config.focal_length == 0.0) {
        result.spot_waist_x = (config.waist_x == 0.0) ? beam_.get_waist_radius() : config.waist_x;
        result.spot_waist_y = (config.waist_y == 0.0) ? result.spot_waist_x : config.waist_y;
        result.efficiency = GaussianBeam::fiber_coupling_efficiency(
            config.mode_field_diameter, result.spot_waist_x, result.spot_waist_y);

        spdlog::info("Direct fiber coupling");
    } else {
        if (!(config.focal_length > 0.0)) {
            throw std::invalid_argument("Fiber coupling lens must have a positive focal length.");
        }
        const double incident_waist =
            (config.incident_waist == 0.0) ? beam_.get_waist_radius() : config.incident_waist;
        result.spot_waist_x = beam_.focused_waist(config.focal_length, incident_waist);
        result.spot_waist_y = result.spot_waist_x;
        result.efficiency = beam_.fiber_coupling_efficiency_via_lens(
            config.mode_field_diameter, config.focal_length, incident_waist);

        spdlog::info("Fiber coupling through f = {} m lens (incident waist {} m)",
                     config.focal_length, incident_waist);
    }

    result.loss_db = -10.0 * std::log10(result.efficiency);

    spdlog::info("   MFD: {} m, spot waist: {} x {} m",
                 config.mode_field_diameter, result.spot_waist_x, result.spot_waist_y);
    spdlog::info("   Efficiency: {:.4f} ({:.3f} dB loss, facet reflection not included)",
                 result.efficiency, result.loss_db);
    return result;
}

} // namespace gauss_beam
