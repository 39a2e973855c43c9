// ==============================================================================
// Layer 1: DSP Primitives
// periodic_generators.h - Time-Accumulating Periodic Waveforms
// ==============================================================================
// Sine, square and triangle generators driven by an accumulated time t that
// grows by dt on every sample() call. The output is a pure function of
// t mod period, so variable-rate callers get phase-correct waveforms.
//
// Square and triangle shapes are duty-cycle aware:
//
//   Square, duty 0.25:   1.0 for fraction < 0.25, then 0.0
//   Triangle, duty 0.25: rises 0 -> 1 over [0, 0.25), falls 1 -> 0 over
//                        [0.25, 1)
//
// Time is carried in double precision and is never reset; construct a new
// generator to restart from t = 0.
//
// Dependencies:
//   - Layer 0: math_constants.h (kTwoPi), parameter_validation.h
// ==============================================================================

#pragma once

#include <kinetic/dsp/core/math_constants.h>
#include <kinetic/dsp/core/parameter_validation.h>
#include <kinetic/dsp/primitives/signal_generator.h>

#include <cmath>
#include <optional>

namespace Kinetic {
namespace DSP {

// =============================================================================
// PeriodicTiming
// =============================================================================

/// @brief Frequency or period of a periodic generator; exactly one is set.
///
/// @example
/// ```cpp
/// SineWaveGenerator byFreq({.freq = 2.0});
/// SineWaveGenerator byPeriod({.period = 0.5});
/// ```
struct PeriodicTiming {
    std::optional<double> freq;    ///< Hz, > 0
    std::optional<double> period;  ///< Seconds, > 0
};

// =============================================================================
// PeriodicSignalGenerator
// =============================================================================

/// @brief Base for generators that repeat with a fixed frequency.
///
/// Frequency and period are two views of one validated value; setting
/// either updates the other.
class PeriodicSignalGenerator : public SignalGenerator {
public:
    /// @brief Get the frequency in Hz.
    [[nodiscard]] double freq() const noexcept { return freq_; }

    /// @brief Set the frequency. Accumulated time is preserved.
    /// @throws InvalidParameter unless freq is finite and > 0
    void setFreq(double freq) {
        validateFrequency(freq);
        freq_ = freq;
    }

    /// @brief Get the period in seconds (1 / freq).
    [[nodiscard]] double period() const noexcept { return 1.0 / freq_; }

    /// @brief Set the period. Accumulated time is preserved.
    /// @throws InvalidParameter unless period is finite and > 0 and its
    ///         reciprocal is a valid frequency
    void setPeriod(double period) {
        validatePeriod(period);
        setFreq(1.0 / period);
    }

    /// @brief Accumulated time in seconds.
    [[nodiscard]] double time() const noexcept { return t_; }

    /// @brief Advance time by dt and return the waveform value at the new time.
    /// @throws InvalidParameter if dt is negative or non-finite
    double sample(double dt) final {
        validateTimestep(dt);
        t_ += dt;
        return currentSample();
    }

protected:
    /// @throws InvalidParameter unless exactly one of freq/period is given
    ///         and it is valid
    explicit PeriodicSignalGenerator(const PeriodicTiming& timing)
        : freq_(resolveFrequency(timing)) {}

    /// @brief Waveform value at the current time.
    [[nodiscard]] virtual double currentSample() const noexcept = 0;

    /// @brief Position within the current period, in [0, 1).
    [[nodiscard]] double periodFraction() const noexcept {
        const double p = period();
        return std::fmod(t_, p) / p;
    }

private:
    static double resolveFrequency(const PeriodicTiming& timing) {
        if (!timing.freq && !timing.period) {
            throw InvalidParameter("Either freq or period must be given.");
        }
        if (timing.freq && timing.period) {
            throw InvalidParameter("Only one of freq or period should be given, not both.");
        }
        if (timing.freq) {
            validateFrequency(*timing.freq);
            return *timing.freq;
        }
        validatePeriod(*timing.period);
        const double freq = 1.0 / *timing.period;
        validateFrequency(freq);
        return freq;
    }

    double freq_;
    double t_ = 0.0;
};

// =============================================================================
// SineWaveGenerator
// =============================================================================

/// @brief sin(2 * pi * freq * t), range [-1, 1].
class SineWaveGenerator final : public PeriodicSignalGenerator {
public:
    explicit SineWaveGenerator(const PeriodicTiming& timing)
        : PeriodicSignalGenerator(timing) {}

protected:
    [[nodiscard]] double currentSample() const noexcept override {
        return std::sin(kTwoPi * freq() * time());
    }
};

// =============================================================================
// DutyCycleSignalGenerator
// =============================================================================

/// @brief Periodic generator whose shape is split by a duty cycle.
///
/// The duty cycle is the fraction of each period spent in the "on" portion,
/// in [0.0, 1.0]. Defaults to 0.5.
class DutyCycleSignalGenerator : public PeriodicSignalGenerator {
public:
    [[nodiscard]] double dutyCycle() const noexcept { return dutyCycle_; }

    /// @throws InvalidParameter unless dutyCycle is in [0.0, 1.0]
    void setDutyCycle(double dutyCycle) {
        validateDutyCycle(dutyCycle);
        dutyCycle_ = dutyCycle;
    }

protected:
    DutyCycleSignalGenerator(const PeriodicTiming& timing, double dutyCycle)
        : PeriodicSignalGenerator(timing) {
        setDutyCycle(dutyCycle);
    }

    [[nodiscard]] bool isInDutyCycle() const noexcept {
        return periodFraction() < dutyCycle_;
    }

private:
    double dutyCycle_ = 0.5;
};

// =============================================================================
// SquareWaveGenerator
// =============================================================================

/// @brief Alternates between 1.0 (during the duty cycle) and 0.0.
class SquareWaveGenerator final : public DutyCycleSignalGenerator {
public:
    explicit SquareWaveGenerator(const PeriodicTiming& timing, double dutyCycle = 0.5)
        : DutyCycleSignalGenerator(timing, dutyCycle) {}

protected:
    [[nodiscard]] double currentSample() const noexcept override {
        return isInDutyCycle() ? 1.0 : 0.0;
    }
};

// =============================================================================
// TriangleWaveGenerator
// =============================================================================

/// @brief Ramps 0 -> 1 across the duty cycle, then 1 -> 0 across the rest.
///
/// duty 0.0 degenerates to a falling sawtooth, duty 1.0 to a rising one.
class TriangleWaveGenerator final : public DutyCycleSignalGenerator {
public:
    explicit TriangleWaveGenerator(const PeriodicTiming& timing, double dutyCycle = 0.5)
        : DutyCycleSignalGenerator(timing, dutyCycle) {}

protected:
    [[nodiscard]] double currentSample() const noexcept override {
        const double fraction = periodFraction();
        // fraction < dutyCycle implies dutyCycle > 0 on the upswing.
        if (fraction < dutyCycle()) {
            return fraction / dutyCycle();
        }
        const double offCycle = 1.0 - dutyCycle();
        if (offCycle <= 0.0) {
            return 0.0;
        }
        return (1.0 - fraction) / offCycle;
    }
};

} // namespace DSP
} // namespace Kinetic
