#include <iostream>
#include <iomanip>
#include <vector>
#include <spdlog/spdlog.h>
#include "beam_analyzer.h"
#include "beam_types.h"

using namespace gauss_beam;

int main() {
    try {
        // --- Beam Configuration (SI units) ---
        BeamConfig beam_config;
        beam_config.wavelength = 1550e-9;   // 1550 nm
        beam_config.waist_radius = 5e-6;    // 5 um
        beam_config.waist_position = 0.0;

        spdlog::info("=== Beam Configuration ===");
        spdlog::info("  Wavelength: {} m", beam_config.wavelength);
        spdlog::info("  Waist radius: {} m", beam_config.waist_radius);
        spdlog::info("  Waist position: {} m", beam_config.waist_position);

        BeamAnalyzer analyzer(beam_config);
        const GaussianBeam& beam = analyzer.beam();
        const double z_r = beam.get_rayleigh_length();

        // --- Propagation over +-3 Rayleigh lengths ---
        std::vector<BeamSample> profile = analyzer.sample_profile(-3.0 * z_r, 3.0 * z_r, 7);

        // --- Aperture at one Rayleigh length ---
        ApertureConfig aperture;
        aperture.incident_power = 1.0;      // 1 W
        aperture.aperture_radius = 10e-6;   // 10 um
        aperture.z = z_r;
        ApertureResult aperture_result = analyzer.analyze_aperture(aperture);

        const double r_99 = beam.aperture_radius_for_transmission(0.99, aperture.z);

        // --- Fiber coupling: SMF-28, direct and through a lens ---
        FiberCouplingConfig direct;
        direct.mode_field_diameter = 10.4e-6;
        CouplingResult direct_result = analyzer.analyze_fiber_coupling(direct);

        FiberCouplingConfig via_lens = direct;
        via_lens.focal_length = 11e-3;      // 11 mm aspheric collimator
        via_lens.incident_waist = 1.05e-3;  // collimated beam, 2.1 mm diameter
        CouplingResult lens_result = analyzer.analyze_fiber_coupling(via_lens);

        // --- Report ---
        std::cout << "\n\n=== GAUSSIAN BEAM REPORT ===\n";
        std::cout << std::scientific << std::setprecision(4);

        std::cout << "\nBeam:\n";
        std::cout << "  Rayleigh length:    " << z_r << " m\n";
        std::cout << "  Confocal parameter: " << beam.confocal_parameter() << " m\n";
        std::cout << "  Divergence (half):  " << beam.divergence_half_angle() << " rad\n";

        std::cout << "\nProfile:\n";
        std::cout << "  " << std::setw(12) << "z (m)" << std::setw(14) << "w (m)"
                  << std::setw(14) << "R (m)" << std::setw(14) << "Gouy (rad)" << "\n";
        for (const auto& sample : profile) {
            std::cout << "  " << std::setw(12) << sample.z << std::setw(14) << sample.radius
                      << std::setw(14) << sample.radius_of_curvature
                      << std::setw(14) << sample.gouy_phase << "\n";
        }

        std::cout << "\nAperture (r = " << aperture.aperture_radius << " m, z = " << aperture.z << " m):\n";
        std::cout << "  Beam radius:        " << aperture_result.beam_radius << " m\n";
        std::cout << std::fixed << std::setprecision(6);
        std::cout << "  Transmitted power:  " << aperture_result.transmitted_power << " W\n";
        std::cout << std::scientific << std::setprecision(4);
        std::cout << "  Radius for 99 %:    " << r_99 << " m\n";

        std::cout << std::fixed << std::setprecision(4);
        std::cout << "\nFiber coupling (MFD = " << direct.mode_field_diameter * 1e6 << " um):\n";
        std::cout << "  Direct:     " << direct_result.efficiency
                  << "  (" << std::setprecision(3) << direct_result.loss_db << " dB)\n";
        std::cout << std::setprecision(4);
        std::cout << "  Via lens:   " << lens_result.efficiency
                  << "  (" << std::setprecision(3) << lens_result.loss_db << " dB, focused waist "
                  << lens_result.spot_waist_x * 1e6 << " um)\n";
        std::cout << "  Uncoated facets lose about 8 % more (not included).\n";

        std::cout << "\n============================\n" << std::endl;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error in main: {}", e.what());
        return 1;
    }

    return 0;
}
