// ==============================================================================
// Layer 1: DSP Primitive - Signal Generator Interface
// ==============================================================================
// Abstract capability shared by every synthetic signal source.
//
// Known implementations: SineWaveGenerator, SquareWaveGenerator,
// TriangleWaveGenerator (periodic_generators.h), UniformRandomSignalGenerator,
// GaussianRandomSignalGenerator (random_generators.h).
// ==============================================================================

#pragma once

#include <cstddef>

namespace Kinetic {
namespace DSP {

/// @brief Abstract interface for per-tick signal generators.
class SignalGenerator {
public:
    virtual ~SignalGenerator() = default;

    /// @brief Advance by dt and produce the next sample.
    /// @param dt Time since the previous call, in seconds
    /// @return Generated sample
    virtual double sample(double dt) = 0;

    /// @brief Shorthand for sample(dt).
    double operator()(double dt) {
        return sample(dt);
    }

    /// @brief Fill a buffer at a fixed timestep.
    ///
    /// Equivalent to calling sample() numSamples times.
    void sampleBlock(double* output, size_t numSamples, double dt) {
        for (size_t i = 0; i < numSamples; ++i) {
            output[i] = sample(dt);
        }
    }

protected:
    SignalGenerator() = default;
    SignalGenerator(const SignalGenerator&) = default;
    SignalGenerator& operator=(const SignalGenerator&) = default;
    SignalGenerator(SignalGenerator&&) noexcept = default;
    SignalGenerator& operator=(SignalGenerator&&) noexcept = default;
};

} // namespace DSP
} // namespace Kinetic
