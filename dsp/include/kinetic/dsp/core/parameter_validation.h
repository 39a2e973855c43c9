// ==============================================================================
// Layer 0: Core Utility - Parameter Validation
// ==============================================================================
// Shared precondition checks for filter and generator parameters.
//
// Every constructor and setter in the library runs its arguments through
// these helpers before touching any member, so a rejected call never leaves
// an instance partially updated.
//
// Error model:
// - One error kind, InvalidParameter (an std::invalid_argument).
// - Thrown only at configuration time (constructors, setters, dt guard).
// - The message names the parameter and the rejected value.
// ==============================================================================

#pragma once

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace Kinetic {
namespace DSP {

/// @brief Raised when a numeric or symbolic parameter violates its precondition.
class InvalidParameter : public std::invalid_argument {
public:
    explicit InvalidParameter(const std::string& message)
        : std::invalid_argument(message) {}
};

namespace detail {

/// @brief Format "<name> <requirement>; got <value>." for InvalidParameter.
[[nodiscard]] inline std::string describeRejection(std::string_view name,
                                                   std::string_view requirement,
                                                   double value) {
    std::ostringstream os;
    os << name << ' ' << requirement << "; got " << value << '.';
    return os.str();
}

} // namespace detail

// =============================================================================
// Cutoff Frequencies
// =============================================================================

/// @brief Validate a single cutoff frequency.
/// @param cutoffFreq Cutoff in Hz
/// @throws InvalidParameter if cutoffFreq is negative, NaN or infinite
inline void validateCutoffFreq(double cutoffFreq) {
    if (!std::isfinite(cutoffFreq) || cutoffFreq < 0.0) {
        throw InvalidParameter(
            detail::describeRejection("cutoff_freq", "must be finite and >= 0", cutoffFreq));
    }
}

/// @brief Validate an ordered pair of cutoff frequencies.
///
/// Both cutoffs must individually be valid, and the low cutoff may not
/// exceed the high cutoff. Equal cutoffs are accepted.
///
/// @throws InvalidParameter on any violation
inline void validateCutoffFreqs(double lowCutoffFreq, double highCutoffFreq) {
    validateCutoffFreq(lowCutoffFreq);
    validateCutoffFreq(highCutoffFreq);
    if (lowCutoffFreq > highCutoffFreq) {
        std::ostringstream os;
        os << "low_cutoff_freq (" << lowCutoffFreq
           << ") cannot be higher than high_cutoff_freq (" << highCutoffFreq << ").";
        throw InvalidParameter(os.str());
    }
}

// =============================================================================
// Timing
// =============================================================================

/// @brief Validate a caller-supplied timestep.
///
/// dt = 0 is accepted; negative and non-finite timesteps are not.
///
/// @throws InvalidParameter if dt is negative, NaN or infinite
inline void validateTimestep(double dt) {
    if (!std::isfinite(dt) || dt < 0.0) {
        throw InvalidParameter(detail::describeRejection("dt", "must be finite and >= 0", dt));
    }
}

/// @brief Validate a generator frequency.
/// @throws InvalidParameter unless freq is finite and > 0
inline void validateFrequency(double freq) {
    if (!std::isfinite(freq) || freq <= 0.0) {
        throw InvalidParameter(detail::describeRejection("freq", "must be finite and > 0", freq));
    }
}

/// @brief Validate a generator period.
/// @throws InvalidParameter unless period is finite and > 0
inline void validatePeriod(double period) {
    if (!std::isfinite(period) || period <= 0.0) {
        throw InvalidParameter(
            detail::describeRejection("period", "must be finite and > 0", period));
    }
}

/// @brief Validate a duty cycle fraction.
/// @throws InvalidParameter unless dutyCycle is in [0.0, 1.0]
inline void validateDutyCycle(double dutyCycle) {
    // Written so that NaN fails the check too.
    if (!(dutyCycle >= 0.0 && dutyCycle <= 1.0)) {
        throw InvalidParameter(
            detail::describeRejection("duty_cycle", "must be in range [0.0, 1.0]", dutyCycle));
    }
}

// =============================================================================
// Distributions
// =============================================================================

/// @brief Validate a uniform range [low, high).
/// @throws InvalidParameter unless both bounds are finite and low < high
inline void validateUniformRange(double low, double high) {
    if (!std::isfinite(low) || !std::isfinite(high) || !(low < high)) {
        std::ostringstream os;
        os << "low (" << low << ") must be lower than high (" << high
           << ") and both must be finite.";
        throw InvalidParameter(os.str());
    }
}

/// @brief Validate a Gaussian mean.
/// @throws InvalidParameter if mean is NaN or infinite
inline void validateMean(double mean) {
    if (!std::isfinite(mean)) {
        throw InvalidParameter(detail::describeRejection("mean", "must be finite", mean));
    }
}

/// @brief Validate a Gaussian standard deviation.
/// @throws InvalidParameter if stdDev is negative, NaN or infinite
inline void validateStdDev(double stdDev) {
    if (!std::isfinite(stdDev) || stdDev < 0.0) {
        throw InvalidParameter(
            detail::describeRejection("std_dev", "must be finite and >= 0", stdDev));
    }
}

} // namespace DSP
} // namespace Kinetic
