// ==============================================================================
// Layer 0: Core Utilities
// random.h - Injectable Random Sources
// ==============================================================================
// Random generators draw through the RandomSource interface so that the
// generator core has no dependency on a specific entropy source.
//
// Two implementations are provided:
// - PseudoRandomSource: deterministic Xorshift32 stream, reproducible by seed
// - TrueRandomSource:   non-deterministic draws from std::random_device
//
// Randomness selects between them; any other selector value is rejected.
// ==============================================================================

#pragma once

#include <kinetic/dsp/core/math_constants.h>
#include <kinetic/dsp/core/parameter_validation.h>

#include <cmath>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace Kinetic {
namespace DSP {

// ==============================================================================
// Xorshift32 PRNG
// ==============================================================================

/// Fast 32-bit pseudo-random number generator using xorshift algorithm.
///
/// Period of 2^32-1. Algorithm: Marsaglia's xorshift with shifts 13, 17, 5.
///
/// @note NOT cryptographically secure
///
/// @example Basic usage:
///     Xorshift32 rng(12345);
///     double u = rng.nextUnit();  // Returns [0.0, 1.0)
///
class Xorshift32 {
public:
    /// Construct with seed value.
    /// @param seedValue Initial seed (0 is automatically replaced with default)
    explicit constexpr Xorshift32(uint32_t seedValue = 1) noexcept
        : state_(seedValue != 0 ? seedValue : kDefaultSeed) {}

    /// Generate next 32-bit unsigned integer.
    /// @return Random uint32_t in range [1, 2^32-1]
    [[nodiscard]] constexpr uint32_t next() noexcept {
        state_ ^= state_ << 13;
        state_ ^= state_ >> 17;
        state_ ^= state_ << 5;
        return state_;
    }

    /// Generate next double in the half-open unit interval.
    /// @return Random double in range [0.0, 1.0)
    [[nodiscard]] constexpr double nextUnit() noexcept {
        return static_cast<double>(next()) * kToUnit;
    }

private:
    /// Default seed used when 0 is passed (0 would cause generator to output only zeros)
    static constexpr uint32_t kDefaultSeed = 2463534242u;

    /// 1 / 2^32. The largest output (2^32 - 1) maps strictly below 1.0.
    static constexpr double kToUnit = 1.0 / 4294967296.0;

    uint32_t state_;
};

// ==============================================================================
// RandomSource Interface
// ==============================================================================

/// @brief Abstract source of uniform and Gaussian variates.
///
/// Implementations only need nextUnit(). nextGaussian() defaults to a
/// Box-Muller transform of two unit draws and caches the second variate.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /// @brief Next uniform variate.
    /// @return Value in [0.0, 1.0)
    [[nodiscard]] virtual double nextUnit() = 0;

    /// @brief Next standard normal variate (mean 0, standard deviation 1).
    [[nodiscard]] virtual double nextGaussian() {
        if (hasSpare_) {
            hasSpare_ = false;
            return spare_;
        }
        // 1 - u maps [0, 1) onto (0, 1], keeping log() finite.
        const double u1 = 1.0 - nextUnit();
        const double u2 = nextUnit();
        const double radius = std::sqrt(-2.0 * std::log(u1));
        const double theta = kTwoPi * u2;
        spare_ = radius * std::sin(theta);
        hasSpare_ = true;
        return radius * std::cos(theta);
    }

    /// @brief Uniform draw scaled to [low, high).
    ///
    /// Interpolates between the bounds instead of scaling (high - low), which
    /// overflows for finite bounds of large opposite magnitude. Rounding can
    /// still land on a bound, so the result is pulled back inside the range.
    [[nodiscard]] double uniform(double low, double high) {
        const double u = nextUnit();
        double value = low * (1.0 - u) + high * u;
        if (value < low) {
            value = low;
        }
        if (!(value < high)) {
            value = std::nextafter(high, low);
        }
        return value;
    }

    /// @brief Gaussian draw with the given mean and standard deviation.
    [[nodiscard]] double gaussian(double mean, double stdDev) {
        return mean + stdDev * nextGaussian();
    }

private:
    double spare_ = 0.0;
    bool hasSpare_ = false;
};

// ==============================================================================
// Concrete Sources
// ==============================================================================

/// @brief Deterministic source; identical seeds yield identical streams.
///
/// Seeds are 64-bit. The two halves are xor-folded into the 32-bit Xorshift
/// state, so any seed below 2^32 maps to itself.
class PseudoRandomSource final : public RandomSource {
public:
    explicit PseudoRandomSource(uint64_t seedValue) noexcept
        : rng_(foldSeed(seedValue)) {}

    [[nodiscard]] static constexpr uint32_t foldSeed(uint64_t seedValue) noexcept {
        return static_cast<uint32_t>(seedValue ^ (seedValue >> 32));
    }

    [[nodiscard]] double nextUnit() override {
        return rng_.nextUnit();
    }

private:
    Xorshift32 rng_;
};

/// @brief Non-deterministic source backed by std::random_device.
class TrueRandomSource final : public RandomSource {
public:
    TrueRandomSource() = default;

    [[nodiscard]] double nextUnit() override {
        // 53 random bits from two 32-bit draws, scaled to [0, 1).
        const uint32_t a = device_() >> 5;
        const uint32_t b = device_() >> 6;
        return (static_cast<double>(a) * 67108864.0 + static_cast<double>(b))
             * (1.0 / 9007199254740992.0);
    }

private:
    std::random_device device_;
};

// ==============================================================================
// Source Selection
// ==============================================================================

/// @brief Randomness source selector.
enum class Randomness : uint8_t {
    Pseudo = 0,  ///< Deterministic, seedable (default)
    True         ///< Non-deterministic, seed is ignored
};

/// @brief Map a textual selector ("pseudo" or "true") to Randomness.
/// @throws InvalidParameter for any other token
[[nodiscard]] inline Randomness parseRandomness(std::string_view token) {
    if (token == "pseudo") {
        return Randomness::Pseudo;
    }
    if (token == "true") {
        return Randomness::True;
    }
    throw InvalidParameter("randomness must be either \"pseudo\" or \"true\"; got '"
                           + std::string(token) + "'.");
}

/// @brief Textual name of a selector, the inverse of parseRandomness().
[[nodiscard]] inline std::string_view randomnessName(Randomness randomness) noexcept {
    return randomness == Randomness::True ? "true" : "pseudo";
}

/// @brief Build the source a selector names.
///
/// @param randomness Source selector
/// @param seed Seed for the pseudo source. When absent the pseudo source is
///             seeded from std::random_device. Ignored for the true source.
/// @throws InvalidParameter if randomness is not a recognised enumerator
[[nodiscard]] inline std::unique_ptr<RandomSource> makeRandomSource(
    Randomness randomness, std::optional<uint64_t> seed = std::nullopt) {
    switch (randomness) {
        case Randomness::Pseudo: {
            if (!seed) {
                std::random_device device;
                seed = device();
            }
            return std::make_unique<PseudoRandomSource>(*seed);
        }
        case Randomness::True:
            return std::make_unique<TrueRandomSource>();
    }
    throw InvalidParameter(detail::describeRejection(
        "randomness", "must be Pseudo or True", static_cast<double>(randomness)));
}

} // namespace DSP
} // namespace Kinetic
