#pragma once
// ==============================================================================
// Test Signal Generators
// ==============================================================================
// Standard test signals and measurements for filter verification.
// Signals are indexed by control-loop tick at a fixed timestep dt.
// ==============================================================================

#include <cmath>
#include <cstddef>
#include <numbers>
#include <random>
#include <vector>

namespace TestHelpers {

// ==============================================================================
// Constants
// ==============================================================================

constexpr double kPi = std::numbers::pi_v<double>;
constexpr double kTwoPi = 2.0 * kPi;

// ==============================================================================
// Sine Wave
// ==============================================================================
// Pure sinusoid sampled every dt seconds. Used for frequency response.

inline std::vector<double> makeSine(size_t size,
                                    double frequency,
                                    double dt,
                                    double amplitude = 1.0) {
    std::vector<double> buffer(size);
    for (size_t i = 0; i < size; ++i) {
        buffer[i] = amplitude * std::sin(kTwoPi * frequency * dt * static_cast<double>(i));
    }
    return buffer;
}

// ==============================================================================
// White Noise
// ==============================================================================
// Deterministic uniform noise in [-amplitude, amplitude].

inline std::vector<double> makeNoise(size_t size, unsigned seed = 42, double amplitude = 1.0) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> dist(-amplitude, amplitude);
    std::vector<double> buffer(size);
    for (auto& sample : buffer) {
        sample = dist(rng);
    }
    return buffer;
}

// ==============================================================================
// Measurements
// ==============================================================================

/// RMS of buffer[skip, end)
inline double calculateRMS(const std::vector<double>& buffer, size_t skip = 0) {
    if (buffer.size() <= skip) return 0.0;
    double sumSquares = 0.0;
    for (size_t i = skip; i < buffer.size(); ++i) {
        sumSquares += buffer[i] * buffer[i];
    }
    return std::sqrt(sumSquares / static_cast<double>(buffer.size() - skip));
}

/// Linear amplitude to dB, floored at -144 dB
inline double linearToDb(double linear) {
    if (linear <= 0.0) return -144.0;
    return 20.0 * std::log10(linear);
}

/// Attenuation in dB from input to output RMS (positive = quieter output)
inline double attenuationDb(const std::vector<double>& input,
                            const std::vector<double>& output,
                            size_t skip = 0) {
    return linearToDb(calculateRMS(input, skip)) - linearToDb(calculateRMS(output, skip));
}

} // namespace TestHelpers
