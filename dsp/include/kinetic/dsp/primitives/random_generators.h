// ==============================================================================
// Layer 1: DSP Primitives
// random_generators.h - Uniform and Gaussian Noise Generators
// ==============================================================================
// Independent random draws per sample() call. The timestep is ignored: noise
// generators keep no clock.
//
// The random source is owned exclusively and is either built from a
// Randomness selector (+ optional seed) or injected by the caller, e.g. a
// deterministic stub in tests.
//
// Dependencies:
//   - Layer 0: random.h (RandomSource, Randomness), parameter_validation.h
// ==============================================================================

#pragma once

#include <kinetic/dsp/core/parameter_validation.h>
#include <kinetic/dsp/core/random.h>
#include <kinetic/dsp/primitives/signal_generator.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <utility>

namespace Kinetic {
namespace DSP {

// =============================================================================
// RandomSignalGenerator
// =============================================================================

/// @brief Base for generators that draw from an owned RandomSource.
///
/// Move-only: the random source is not shared.
class RandomSignalGenerator : public SignalGenerator {
public:
    RandomSignalGenerator(const RandomSignalGenerator&) = delete;
    RandomSignalGenerator& operator=(const RandomSignalGenerator&) = delete;
    RandomSignalGenerator(RandomSignalGenerator&&) noexcept = default;
    RandomSignalGenerator& operator=(RandomSignalGenerator&&) noexcept = default;

protected:
    /// @param seed Seed for the pseudo source (ignored for Randomness::True)
    /// @param randomness Source selector
    /// @throws InvalidParameter if randomness is not a recognised enumerator
    RandomSignalGenerator(std::optional<uint64_t> seed, Randomness randomness)
        : source_(makeRandomSource(randomness, seed)) {}

    /// @throws InvalidParameter if source is null
    explicit RandomSignalGenerator(std::unique_ptr<RandomSource> source)
        : source_(std::move(source)) {
        if (!source_) {
            throw InvalidParameter("random source must not be null.");
        }
    }

    [[nodiscard]] RandomSource& source() noexcept { return *source_; }

private:
    std::unique_ptr<RandomSource> source_;
};

// =============================================================================
// UniformRandomSignalGenerator
// =============================================================================

/// @brief Uniformly distributed samples over [low, high).
///
/// @example
/// ```cpp
/// UniformRandomSignalGenerator noise(-0.1, 0.1, 42u);
/// double n = noise.sample(dt);
/// ```
class UniformRandomSignalGenerator final : public RandomSignalGenerator {
public:
    /// @throws InvalidParameter unless low < high (both finite)
    explicit UniformRandomSignalGenerator(double low = 0.0,
                                          double high = 1.0,
                                          std::optional<uint64_t> seed = std::nullopt,
                                          Randomness randomness = Randomness::Pseudo)
        : RandomSignalGenerator(seed, randomness) {
        setRange(low, high);
    }

    /// @throws InvalidParameter unless low < high, or if source is null
    UniformRandomSignalGenerator(double low, double high, std::unique_ptr<RandomSource> source)
        : RandomSignalGenerator(std::move(source)) {
        setRange(low, high);
    }

    [[nodiscard]] double low() const noexcept { return low_; }
    [[nodiscard]] double high() const noexcept { return high_; }

    /// @throws InvalidParameter unless low < high (both finite)
    void setRange(double low, double high) {
        validateUniformRange(low, high);
        low_ = low;
        high_ = high;
    }

    double sample(double /*dt*/) override {
        return source().uniform(low_, high_);
    }

private:
    double low_ = 0.0;
    double high_ = 1.0;
};

// =============================================================================
// GaussianRandomSignalGenerator
// =============================================================================

/// @brief Normally distributed samples with the given mean and deviation.
class GaussianRandomSignalGenerator final : public RandomSignalGenerator {
public:
    /// @throws InvalidParameter if mean is non-finite or stdDev is negative
    explicit GaussianRandomSignalGenerator(double mean = 0.0,
                                           double stdDev = 1.0,
                                           std::optional<uint64_t> seed = std::nullopt,
                                           Randomness randomness = Randomness::Pseudo)
        : RandomSignalGenerator(seed, randomness) {
        setDistribution(mean, stdDev);
    }

    /// @throws InvalidParameter on invalid distribution or null source
    GaussianRandomSignalGenerator(double mean, double stdDev, std::unique_ptr<RandomSource> source)
        : RandomSignalGenerator(std::move(source)) {
        setDistribution(mean, stdDev);
    }

    [[nodiscard]] double mean() const noexcept { return mean_; }
    [[nodiscard]] double stdDev() const noexcept { return stdDev_; }

    /// @throws InvalidParameter if mean is non-finite
    void setMean(double mean) {
        validateMean(mean);
        mean_ = mean;
    }

    /// @throws InvalidParameter if stdDev is negative or non-finite
    void setStdDev(double stdDev) {
        validateStdDev(stdDev);
        stdDev_ = stdDev;
    }

    double sample(double /*dt*/) override {
        return source().gaussian(mean_, stdDev_);
    }

private:
    void setDistribution(double mean, double stdDev) {
        validateMean(mean);
        validateStdDev(stdDev);
        mean_ = mean;
        stdDev_ = stdDev;
    }

    double mean_ = 0.0;
    double stdDev_ = 1.0;
};

} // namespace DSP
} // namespace Kinetic
