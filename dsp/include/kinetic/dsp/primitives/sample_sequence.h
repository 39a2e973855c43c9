// ==============================================================================
// Layer 1: DSP Primitives
// sample_sequence.h - Lazy Sample Sequences
// ==============================================================================
// Convenience range over repeated SignalGenerator::sample(dt) calls.
//
// A sequence is either finite (exactly `count` samples) or infinite. Samples
// are drawn lazily, only when a position is read or skipped, so an infinite
// sequence is safe to iterate as long as the loop breaks on its own and a
// view such as std::views::take(n) advances the generator exactly n times.
//
// The sequence is single-pass: it drives the generator it refers to, and
// the generator's state advances with every sample drawn. The generator must
// outlive the sequence.
// ==============================================================================

#pragma once

#include <kinetic/dsp/primitives/signal_generator.h>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <optional>
#include <vector>

namespace Kinetic {
namespace DSP {

/// @brief Single-pass input range of generator samples.
///
/// @example
/// ```cpp
/// SineWaveGenerator sine({.freq = 1.0});
/// for (double s : sampleSequence(sine, 0.01, 100)) {
///     controller.update(s);
/// }
/// ```
class SampleSequence {
public:
    struct Sentinel {};

    class Iterator {
    public:
        using iterator_concept = std::input_iterator_tag;
        using value_type = double;
        using difference_type = std::ptrdiff_t;

        Iterator() noexcept = default;
        explicit Iterator(SampleSequence* sequence) noexcept
            : sequence_(sequence) {}

        /// Draws the sample for this position on first read.
        [[nodiscard]] double operator*() const {
            if (!sequence_->drawn_) {
                sequence_->draw();
            }
            return sequence_->current_;
        }

        /// Moves past the current sample. A position that was never read is
        /// still drawn, so skipping advances the generator like reading does.
        Iterator& operator++() {
            if (!sequence_->drawn_) {
                sequence_->draw();
            }
            sequence_->drawn_ = false;
            return *this;
        }

        void operator++(int) { ++*this; }

        [[nodiscard]] bool atEnd() const noexcept {
            return sequence_ == nullptr || sequence_->exhausted();
        }

        friend bool operator==(const Iterator& it, Sentinel) noexcept {
            return it.atEnd();
        }

    private:
        SampleSequence* sequence_ = nullptr;
    };

    /// @brief Infinite sequence.
    SampleSequence(SignalGenerator& generator, double dt) noexcept
        : generator_(&generator)
        , dt_(dt) {}

    /// @brief Finite sequence of exactly `count` samples.
    SampleSequence(SignalGenerator& generator, double dt, size_t count) noexcept
        : generator_(&generator)
        , dt_(dt)
        , remaining_(count) {}

    // Iterators point back into the sequence.
    SampleSequence(const SampleSequence&) = delete;
    SampleSequence& operator=(const SampleSequence&) = delete;

    [[nodiscard]] bool isInfinite() const noexcept { return !remaining_.has_value(); }

    /// @brief Samples not yet drawn from the generator; nullopt when infinite.
    [[nodiscard]] std::optional<size_t> remaining() const noexcept { return remaining_; }

    [[nodiscard]] double dt() const noexcept { return dt_; }

    /// @brief Start (or resume) iteration. Draws nothing.
    ///
    /// A sample already read through an iterator is not yielded again, so a
    /// loop that breaks early can be resumed without repeats.
    [[nodiscard]] Iterator begin() noexcept {
        drawn_ = false;
        return Iterator(this);
    }

    [[nodiscard]] Sentinel end() const noexcept { return {}; }

    /// @brief Consume up to maxSamples samples into a vector.
    ///
    /// Returns fewer than maxSamples only when a finite sequence runs out.
    [[nodiscard]] std::vector<double> collect(size_t maxSamples) {
        drawn_ = false;
        std::vector<double> samples;
        samples.reserve(remaining_ ? std::min(maxSamples, *remaining_) : maxSamples);
        while (samples.size() < maxSamples && !exhausted()) {
            draw();
            samples.push_back(current_);
            drawn_ = false;
        }
        return samples;
    }

private:
    [[nodiscard]] bool exhausted() const noexcept {
        return !drawn_ && remaining_ && *remaining_ == 0;
    }

    void draw() {
        current_ = generator_->sample(dt_);
        if (remaining_) {
            --*remaining_;
        }
        drawn_ = true;
    }

    SignalGenerator* generator_;
    double dt_;
    std::optional<size_t> remaining_;  ///< nullopt = infinite
    double current_ = 0.0;             ///< Most recent draw
    bool drawn_ = false;               ///< current_ belongs to the iterator's position
};

/// @brief Infinite lazy sequence of generator.sample(dt).
[[nodiscard]] inline SampleSequence sampleSequence(SignalGenerator& generator, double dt) noexcept {
    return SampleSequence(generator, dt);
}

/// @brief Lazy sequence of exactly `count` generator.sample(dt) values.
[[nodiscard]] inline SampleSequence sampleSequence(SignalGenerator& generator,
                                                   double dt,
                                                   size_t count) noexcept {
    return SampleSequence(generator, dt, count);
}

} // namespace DSP
} // namespace Kinetic
