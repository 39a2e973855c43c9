// ==============================================================================
// Layer 1: DSP Primitives
// one_pole.h - One-Pole Recursive Filters
// ==============================================================================
// First-order low-pass and high-pass filters with a timestep-driven
// coefficient. Unlike sample-rate based audio filters, the smoothing
// coefficient is recomputed on every call from the caller-supplied dt, so the
// filters work under fixed- and variable-rate control loops alike.
//
// SinglePoleFilter holds what both filters share: one validated cutoff
// frequency and one piece of recursive output state.
//
// Dependencies:
//   - Layer 0: math_constants.h (kTwoPi), parameter_validation.h
// ==============================================================================

#pragma once

#include <kinetic/dsp/core/math_constants.h>
#include <kinetic/dsp/core/parameter_validation.h>
#include <kinetic/dsp/primitives/filter.h>

namespace Kinetic {
namespace DSP {

// =============================================================================
// SinglePoleFilter - shared cutoff + output state
// =============================================================================

/// @brief Base for first-order filters with a single cutoff frequency.
///
/// filter() validates dt, delegates to computeOutput() and stores the
/// result as the new previous output.
class SinglePoleFilter : public Filter {
public:
    /// @brief Get the current cutoff frequency in Hz.
    [[nodiscard]] double cutoffFreq() const noexcept { return cutoffFreq_; }

    /// @brief Set the cutoff frequency.
    ///
    /// Takes effect on the next filter() call; recursive state is untouched.
    ///
    /// @param cutoffFreq Cutoff in Hz (finite, >= 0)
    /// @throws InvalidParameter if cutoffFreq is invalid (old value retained)
    void setCutoffFreq(double cutoffFreq) {
        validateCutoffFreq(cutoffFreq);
        cutoffFreq_ = cutoffFreq;
    }

    /// @brief Get the most recent output (or the initial value before any call).
    [[nodiscard]] double previousOutput() const noexcept { return prevOutput_; }

    double filter(double value, double dt) final {
        validateTimestep(dt);
        const double output = computeOutput(value, dt);
        prevOutput_ = output;
        return output;
    }

    /// @brief Re-seed the recursive state without changing the cutoff.
    virtual void reset(double initValue = 0.0) noexcept {
        prevOutput_ = initValue;
    }

    /// @brief Smoothing coefficient that filter() would use for this dt.
    [[nodiscard]] virtual double alpha(double dt) const noexcept = 0;

protected:
    /// @throws InvalidParameter if cutoffFreq is invalid
    SinglePoleFilter(double cutoffFreq, double initValue)
        : prevOutput_(initValue) {
        validateCutoffFreq(cutoffFreq);
        cutoffFreq_ = cutoffFreq;
    }

    /// @brief Compute the new output. dt has already been validated.
    virtual double computeOutput(double value, double dt) noexcept = 0;

    double prevOutput_;

private:
    double cutoffFreq_ = 0.0;
};

// =============================================================================
// LowPassFilter
// =============================================================================

/// @brief First-order low-pass filter (exponential moving average).
///
/// Passes signals below the cutoff frequency and increasingly attenuates
/// signals above it. Useful for smoothing noisy sensor readings such as
/// accelerometers or range finders.
///
/// @formula a = 2 * pi * dt * cutoff
///          alpha = a / (a + 1)
///          y[n] = alpha * x[n] + (1 - alpha) * y[n-1]
///
/// At cutoff = 0 alpha is 0 and the output holds its initial value forever.
/// As cutoff or dt grow, alpha approaches 1 and the output tracks the input.
///
/// @example
/// ```cpp
/// LowPassFilter lpf(5.0);          // 5 Hz cutoff
/// double smoothed = lpf.filter(reading, 0.01);
/// ```
class LowPassFilter final : public SinglePoleFilter {
public:
    /// @param cutoffFreq Cutoff in Hz (finite, >= 0)
    /// @param initValue Seed for the previous output
    /// @throws InvalidParameter if cutoffFreq is invalid
    explicit LowPassFilter(double cutoffFreq, double initValue = 0.0)
        : SinglePoleFilter(cutoffFreq, initValue) {}

    /// @return alpha in [0, 1) for any dt >= 0
    [[nodiscard]] double alpha(double dt) const noexcept override {
        const double a = kTwoPi * dt * cutoffFreq();
        return a / (a + 1.0);
    }

protected:
    double computeOutput(double value, double dt) noexcept override {
        const double k = alpha(dt);
        return k * value + (1.0 - k) * prevOutput_;
    }
};

// =============================================================================
// HighPassFilter
// =============================================================================

/// @brief First-order high-pass filter (leaky differentiator).
///
/// Passes signals above the cutoff frequency and increasingly attenuates
/// signals below it. Useful for removing a slowly drifting bias, for
/// example from a gyroscope.
///
/// @formula alpha = 1 / (2 * pi * dt * cutoff + 1)
///          y[n] = alpha * (y[n-1] + x[n] - x[n-1])
///
/// At cutoff = 0 alpha is 1 and every input change passes unattenuated.
/// As cutoff grows, alpha approaches 0 and the output decays to zero.
class HighPassFilter final : public SinglePoleFilter {
public:
    /// @param cutoffFreq Cutoff in Hz (finite, >= 0)
    /// @param initValue Seed for both the previous output and previous input
    /// @throws InvalidParameter if cutoffFreq is invalid
    explicit HighPassFilter(double cutoffFreq, double initValue = 0.0)
        : SinglePoleFilter(cutoffFreq, initValue)
        , prevValue_(initValue) {}

    /// @return alpha in (0, 1] for any dt >= 0
    [[nodiscard]] double alpha(double dt) const noexcept override {
        return 1.0 / (kTwoPi * dt * cutoffFreq() + 1.0);
    }

    /// @brief Get the most recent raw input (or the initial value).
    [[nodiscard]] double previousValue() const noexcept { return prevValue_; }

    void reset(double initValue = 0.0) noexcept override {
        SinglePoleFilter::reset(initValue);
        prevValue_ = initValue;
    }

protected:
    double computeOutput(double value, double dt) noexcept override {
        const double dValue = value - prevValue_;
        prevValue_ = value;
        return alpha(dt) * (prevOutput_ + dValue);
    }

private:
    double prevValue_;  ///< x[n-1]
};

} // namespace DSP
} // namespace Kinetic
