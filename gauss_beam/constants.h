#pragma once


namespace gauss_beam {

    // All lengths in metres, powers in watts.
    constexpr double PI = 3.14159265358979323846;

    // Ideal lens focusing: w_f = LENS_FOCUS_FACTOR * lambda * f / (pi * w_in)
    constexpr double LENS_FOCUS_FACTOR = 4.0;

} // namespace gauss_beam
