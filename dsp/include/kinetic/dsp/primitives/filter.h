// ==============================================================================
// Layer 1: DSP Primitive - Filter Interface
// ==============================================================================
// Abstract capability shared by every causal, stateful filter in the library.
//
// Known implementations: LowPassFilter, HighPassFilter (one_pole.h),
// BandPassFilter, BandStopFilter (band_filters.h).
// ==============================================================================

#pragma once

#include <cstddef>

namespace Kinetic {
namespace DSP {

/// @brief Abstract interface for per-sample filters.
///
/// Each call both advances the recursive state and returns the new output.
/// Instances are not shared between control loops; no method is thread-safe.
class Filter {
public:
    virtual ~Filter() = default;

    /// @brief Filter one sample.
    /// @param value Raw input sample
    /// @param dt Time since the previous call, in seconds (finite, >= 0)
    /// @return Filtered output
    /// @throws InvalidParameter if dt is negative or non-finite
    virtual double filter(double value, double dt) = 0;

    /// @brief Shorthand for filter(value, dt).
    double operator()(double value, double dt) {
        return filter(value, dt);
    }

    /// @brief Filter a buffer in place at a fixed timestep.
    ///
    /// Equivalent to calling filter() for each sample sequentially.
    void filterBlock(double* buffer, size_t numSamples, double dt) {
        for (size_t i = 0; i < numSamples; ++i) {
            buffer[i] = filter(buffer[i], dt);
        }
    }

protected:
    Filter() = default;
    Filter(const Filter&) = default;
    Filter& operator=(const Filter&) = default;
    Filter(Filter&&) noexcept = default;
    Filter& operator=(Filter&&) noexcept = default;
};

} // namespace DSP
} // namespace Kinetic
