#pragma once

#include <vector>
#include "beam/gaussian_beam.h"
#include "beam_types.h"

namespace gauss_beam {

/**
 * @brief High-level API for beam design calculations.
 *
 * Owns a GaussianBeam built from a BeamConfig, evaluates the aperture and
 * fiber coupling formulas from config structs, and logs each evaluation.
 */
class BeamAnalyzer {
public:
    /**
     * @brief Builds the beam from the given configuration.
     * @throws std::invalid_argument if the configuration is not physical.
     */
    explicit BeamAnalyzer(const BeamConfig& config);

    const GaussianBeam& beam() const { return beam_; }

    /**
     * @brief Replaces all beam parameters.
     * On failure the previous beam is left untouched.
     */
    void set_config(const BeamConfig& config);

    /**
     * @brief Samples radius, curvature and Gouy phase on evenly spaced positions.
     * @param z_start First position (m).
     * @param z_end Last position (m), must be greater than z_start.
     * @param num_samples Number of samples, at least 2.
     */
    std::vector<BeamSample> sample_profile(double z_start, double z_end, int num_samples) const;

    /**
     * @brief Evaluates a centered circular aperture.
     */
    ApertureResult analyze_aperture(const ApertureConfig& config) const;

    /**
     * @brief Evaluates single-mode fiber coupling, directly or through a lens.
     */
    CouplingResult analyze_fiber_coupling(const FiberCouplingConfig& config) const;

private:
    GaussianBeam beam_;
};

} // namespace gauss_beam
