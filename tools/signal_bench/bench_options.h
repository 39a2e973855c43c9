// =============================================================================
// Signal Bench - Command-Line Options
// =============================================================================
// Parses the signal_bench command line into a BenchOptions value.
//
// Syntax errors (unknown flags, missing or malformed values, unknown
// generator/filter names) raise UsageError. Domain errors in otherwise
// well-formed values are left for the DSP constructors to report as
// Kinetic::DSP::InvalidParameter.
// =============================================================================

#pragma once

#include <kinetic/dsp/core/random.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace SignalBench {

enum class GeneratorKind : uint8_t {
    Sine = 0,
    Square,
    Triangle,
    Uniform,
    Gaussian
};

enum class FilterKind : uint8_t {
    None = 0,
    LowPass,
    HighPass,
    BandPass,
    BandStop
};

/// Raised for malformed command lines. main() prints usage and exits with 2.
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message)
        : std::runtime_error(message) {}
};

// =============================================================================
// BenchOptions
// =============================================================================

struct BenchOptions {
    GeneratorKind generator = GeneratorKind::Sine;

    // Periodic generators. When neither is given, freq defaults to 1 Hz.
    std::optional<double> freq;
    std::optional<double> period;
    double dutyCycle = 0.5;

    // Uniform generator
    double low = 0.0;
    double high = 1.0;

    // Gaussian generator
    double mean = 0.0;
    double stdDev = 1.0;

    std::optional<uint64_t> seed;
    Kinetic::DSP::Randomness randomness = Kinetic::DSP::Randomness::Pseudo;

    FilterKind filter = FilterKind::None;
    std::optional<double> cutoff;      ///< lowpass / highpass
    std::optional<double> lowCutoff;   ///< bandpass / bandstop
    std::optional<double> highCutoff;  ///< bandpass / bandstop
    double initValue = 0.0;

    double dt = 0.01;
    size_t count = 100;

    bool verbose = false;
    bool help = false;
};

/// @brief Parse argv[1..argc) into options.
/// @throws UsageError on malformed input
/// @throws Kinetic::DSP::InvalidParameter for an unknown --randomness token
[[nodiscard]] BenchOptions parseArguments(const std::vector<std::string>& args);

/// @brief Convenience overload for main().
[[nodiscard]] BenchOptions parseArguments(int argc, const char* const* argv);

void printUsage(std::ostream& os);

[[nodiscard]] const char* generatorName(GeneratorKind kind) noexcept;
[[nodiscard]] const char* filterName(FilterKind kind) noexcept;

} // namespace SignalBench
