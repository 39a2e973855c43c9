// ==============================================================================
// Layer 1: DSP Primitives
// band_filters.h - Band-Pass and Band-Stop Compositions
// ==============================================================================
// Band filters built from the one-pole filters in one_pole.h:
//
//   BandPassFilter:  x --> HighPass(low) --> LowPass(high) --> y   (cascade)
//
//   BandStopFilter:  x --+--> LowPass(low)  --+
//                        |                    (+) --> y            (parallel)
//                        +--> HighPass(high) -+
//
// Each composite embeds its sub-filters by value. Retuning a composite
// changes the sub-filter cutoffs in place; their recursive state carries
// over, so a live re-tune does not produce a restart transient.
//
// Dependencies:
//   - Layer 0: parameter_validation.h
//   - Layer 1: one_pole.h
// ==============================================================================

#pragma once

#include <kinetic/dsp/core/parameter_validation.h>
#include <kinetic/dsp/primitives/filter.h>
#include <kinetic/dsp/primitives/one_pole.h>

namespace Kinetic {
namespace DSP {

// =============================================================================
// DualCutoffFilter - ordered cutoff pair
// =============================================================================

/// @brief Base for filters defined by a low and a high cutoff frequency.
///
/// Invariant: 0 <= lowCutoffFreq() <= highCutoffFreq().
class DualCutoffFilter : public Filter {
public:
    [[nodiscard]] virtual double lowCutoffFreq() const noexcept = 0;
    [[nodiscard]] virtual double highCutoffFreq() const noexcept = 0;

    /// @brief Retune both cutoffs without resetting recursive state.
    /// @throws InvalidParameter if either cutoff is invalid or low > high.
    ///         Nothing is changed in that case.
    void setCutoffFreqs(double lowCutoffFreq, double highCutoffFreq) {
        validateCutoffFreqs(lowCutoffFreq, highCutoffFreq);
        applyCutoffFreqs(lowCutoffFreq, highCutoffFreq);
    }

    /// @brief Re-seed the state of every sub-filter.
    virtual void reset(double initValue = 0.0) noexcept = 0;

protected:
    DualCutoffFilter() = default;

    /// @brief Push already-validated cutoffs into the sub-filters.
    virtual void applyCutoffFreqs(double lowCutoffFreq, double highCutoffFreq) = 0;

    /// @brief Validate and pass through; used in constructor init lists so
    ///        that no sub-filter is built from a rejected pair.
    static double checkedLow(double lowCutoffFreq, double highCutoffFreq) {
        validateCutoffFreqs(lowCutoffFreq, highCutoffFreq);
        return lowCutoffFreq;
    }
};

// =============================================================================
// BandPassFilter
// =============================================================================

/// @brief Passes signals between the cutoff frequencies.
///
/// The further a signal's frequency lies outside [low, high], the more it is
/// attenuated. Implemented as HighPass(low) followed by LowPass(high); the
/// order is fixed.
///
/// @example
/// ```cpp
/// BandPassFilter bpf(0.5, 20.0);
/// double y = bpf.filter(x, dt);
/// bpf.setCutoffFreqs(1.0, 10.0);   // live re-tune
/// ```
class BandPassFilter final : public DualCutoffFilter {
public:
    /// @param lowCutoffFreq High-pass stage cutoff in Hz
    /// @param highCutoffFreq Low-pass stage cutoff in Hz
    /// @param initValue Seed forwarded to both stages
    /// @throws InvalidParameter unless 0 <= low <= high
    BandPassFilter(double lowCutoffFreq, double highCutoffFreq, double initValue = 0.0)
        : hpf_(checkedLow(lowCutoffFreq, highCutoffFreq), initValue)
        , lpf_(highCutoffFreq, initValue) {}

    [[nodiscard]] double lowCutoffFreq() const noexcept override { return hpf_.cutoffFreq(); }
    [[nodiscard]] double highCutoffFreq() const noexcept override { return lpf_.cutoffFreq(); }

    double filter(double value, double dt) override {
        validateTimestep(dt);
        return lpf_.filter(hpf_.filter(value, dt), dt);
    }

    void reset(double initValue = 0.0) noexcept override {
        hpf_.reset(initValue);
        lpf_.reset(initValue);
    }

    /// @brief Read-only access to the high-pass (first) stage.
    [[nodiscard]] const HighPassFilter& highPassStage() const noexcept { return hpf_; }

    /// @brief Read-only access to the low-pass (second) stage.
    [[nodiscard]] const LowPassFilter& lowPassStage() const noexcept { return lpf_; }

protected:
    void applyCutoffFreqs(double lowCutoffFreq, double highCutoffFreq) override {
        hpf_.setCutoffFreq(lowCutoffFreq);
        lpf_.setCutoffFreq(highCutoffFreq);
    }

private:
    HighPassFilter hpf_;  ///< Tuned to the low cutoff
    LowPassFilter lpf_;   ///< Tuned to the high cutoff
};

// =============================================================================
// BandStopFilter
// =============================================================================

/// @brief Passes signals outside the cutoff frequencies.
///
/// The further a signal's frequency lies inside [low, high], the more it is
/// attenuated. The raw input is fed to LowPass(low) and HighPass(high)
/// independently and their outputs are summed.
class BandStopFilter final : public DualCutoffFilter {
public:
    /// @param lowCutoffFreq Low-pass branch cutoff in Hz
    /// @param highCutoffFreq High-pass branch cutoff in Hz
    /// @param initValue Seed forwarded to both branches
    /// @throws InvalidParameter unless 0 <= low <= high
    BandStopFilter(double lowCutoffFreq, double highCutoffFreq, double initValue = 0.0)
        : lpf_(checkedLow(lowCutoffFreq, highCutoffFreq), initValue)
        , hpf_(highCutoffFreq, initValue) {}

    [[nodiscard]] double lowCutoffFreq() const noexcept override { return lpf_.cutoffFreq(); }
    [[nodiscard]] double highCutoffFreq() const noexcept override { return hpf_.cutoffFreq(); }

    double filter(double value, double dt) override {
        validateTimestep(dt);
        const double low = lpf_.filter(value, dt);
        const double high = hpf_.filter(value, dt);
        return low + high;
    }

    void reset(double initValue = 0.0) noexcept override {
        lpf_.reset(initValue);
        hpf_.reset(initValue);
    }

    /// @brief Read-only access to the low-pass branch.
    [[nodiscard]] const LowPassFilter& lowPassBranch() const noexcept { return lpf_; }

    /// @brief Read-only access to the high-pass branch.
    [[nodiscard]] const HighPassFilter& highPassBranch() const noexcept { return hpf_; }

protected:
    void applyCutoffFreqs(double lowCutoffFreq, double highCutoffFreq) override {
        lpf_.setCutoffFreq(lowCutoffFreq);
        hpf_.setCutoffFreq(highCutoffFreq);
    }

private:
    LowPassFilter lpf_;   ///< Tuned to the low cutoff
    HighPassFilter hpf_;  ///< Tuned to the high cutoff
};

} // namespace DSP
} // namespace Kinetic
