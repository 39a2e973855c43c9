// =============================================================================
// Signal Bench - Option Parsing and Pipeline Tests
// =============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "bench_options.h"
#include "bench_runner.h"

#include <kinetic/dsp/core/parameter_validation.h>
#include <kinetic/dsp/primitives/one_pole.h>
#include <kinetic/dsp/primitives/periodic_generators.h>

#include <sstream>
#include <string>
#include <vector>

using namespace SignalBench;
using Catch::Approx;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;
using Kinetic::DSP::InvalidParameter;
using Kinetic::DSP::Randomness;

namespace {

std::vector<std::string> splitRows(const std::string& csv) {
    std::vector<std::string> rows;
    std::istringstream in(csv);
    std::string line;
    while (std::getline(in, line)) {
        rows.push_back(line);
    }
    return rows;
}

std::vector<double> splitFields(const std::string& row) {
    std::vector<double> fields;
    std::istringstream in(row);
    std::string field;
    while (std::getline(in, field, ',')) {
        fields.push_back(std::stod(field));
    }
    return fields;
}

} // anonymous namespace

// =============================================================================
// Option parsing
// =============================================================================

TEST_CASE("parseArguments defaults", "[signal_bench][options]") {
    const BenchOptions options = parseArguments(std::vector<std::string>{});

    REQUIRE(options.generator == GeneratorKind::Sine);
    REQUIRE_FALSE(options.freq.has_value());
    REQUIRE_FALSE(options.period.has_value());
    REQUIRE(options.filter == FilterKind::None);
    REQUIRE(options.dt == 0.01);
    REQUIRE(options.count == 100);
    REQUIRE(options.randomness == Randomness::Pseudo);
    REQUIRE_FALSE(options.seed.has_value());
    REQUIRE_FALSE(options.verbose);
    REQUIRE_FALSE(options.help);
}

TEST_CASE("parseArguments reads every flag", "[signal_bench][options]") {
    const std::vector<std::string> args = {
        "--generator", "triangle", "--period", "0.5", "--duty-cycle", "0.25",
        "--low", "-2", "--high", "2", "--mean", "1.5", "--std-dev", "0.1",
        "--seed", "4294967295", "--randomness", "true",
        "--filter", "bandstop", "--low-cutoff", "1", "--high-cutoff", "10",
        "--init-value", "0.75", "--dt", "0.002", "--count", "250", "--verbose"};
    const BenchOptions options = parseArguments(args);

    REQUIRE(options.generator == GeneratorKind::Triangle);
    REQUIRE(options.period == 0.5);
    REQUIRE(options.dutyCycle == 0.25);
    REQUIRE(options.low == -2.0);
    REQUIRE(options.high == 2.0);
    REQUIRE(options.mean == 1.5);
    REQUIRE(options.stdDev == 0.1);
    REQUIRE(options.seed == 4294967295u);
    REQUIRE(options.randomness == Randomness::True);
    REQUIRE(options.filter == FilterKind::BandStop);
    REQUIRE(options.lowCutoff == 1.0);
    REQUIRE(options.highCutoff == 10.0);
    REQUIRE(options.initValue == 0.75);
    REQUIRE(options.dt == 0.002);
    REQUIRE(options.count == 250);
    REQUIRE(options.verbose);
}

TEST_CASE("parseArguments stops at --help", "[signal_bench][options]") {
    const BenchOptions options = parseArguments(std::vector<std::string>{"--help", "--bogus"});
    REQUIRE(options.help);
}

TEST_CASE("parseArguments rejects malformed command lines", "[signal_bench][options][error]") {
    using Args = std::vector<std::string>;

    REQUIRE_THROWS_AS(parseArguments(Args{"--bogus"}), UsageError);
    REQUIRE_THROWS_AS(parseArguments(Args{"--freq"}), UsageError);
    REQUIRE_THROWS_AS(parseArguments(Args{"--freq", "fast"}), UsageError);
    REQUIRE_THROWS_AS(parseArguments(Args{"--dt", "0.01s"}), UsageError);
    REQUIRE_THROWS_AS(parseArguments(Args{"--count", "-5"}), UsageError);
    REQUIRE_THROWS_AS(parseArguments(Args{"--seed", "18446744073709551616"}), UsageError);
    REQUIRE_THROWS_AS(parseArguments(Args{"--generator", "sawtooth"}), UsageError);
    REQUIRE_THROWS_AS(parseArguments(Args{"--filter", "notch"}), UsageError);

    REQUIRE_THROWS_WITH(parseArguments(Args{"--filter", "lowpass"}),
                        ContainsSubstring("--cutoff"));
    REQUIRE_THROWS_WITH(parseArguments(Args{"--filter", "bandpass", "--low-cutoff", "1"}),
                        ContainsSubstring("--high-cutoff"));
}

TEST_CASE("parseArguments reports an unknown randomness as InvalidParameter",
          "[signal_bench][options][error]") {
    const std::vector<std::string> args = {"--randomness", "quantum"};
    REQUIRE_THROWS_AS(parseArguments(args), InvalidParameter);
}

TEST_CASE("parseArguments argv overload skips the program name", "[signal_bench][options]") {
    const char* argv[] = {"signal_bench", "--generator", "square", "--count", "3"};
    const BenchOptions options = parseArguments(5, argv);

    REQUIRE(options.generator == GeneratorKind::Square);
    REQUIRE(options.count == 3);
}

TEST_CASE("printUsage lists every flag", "[signal_bench][options]") {
    std::ostringstream os;
    printUsage(os);
    const std::string usage = os.str();

    for (const char* flag : {"--generator", "--freq", "--period", "--duty-cycle", "--low",
                             "--high", "--mean", "--std-dev", "--seed", "--randomness",
                             "--filter", "--cutoff", "--low-cutoff", "--high-cutoff",
                             "--init-value", "--dt", "--count", "--verbose", "--help"}) {
        REQUIRE_THAT(usage, ContainsSubstring(flag));
    }
}

// =============================================================================
// Pipeline
// =============================================================================

TEST_CASE("makeGenerator builds the selected generator", "[signal_bench][pipeline]") {
    BenchOptions options;

    SECTION("periodic generators default to 1 Hz") {
        auto gen = makeGenerator(options);
        REQUIRE(dynamic_cast<Kinetic::DSP::SineWaveGenerator*>(gen.get()) != nullptr);
        REQUIRE(gen->sample(0.25) == Approx(1.0));
    }

    SECTION("both freq and period are rejected") {
        options.generator = GeneratorKind::Square;
        options.freq = 1.0;
        options.period = 1.0;
        REQUIRE_THROWS_AS(makeGenerator(options), InvalidParameter);
    }

    SECTION("uniform honours the seed") {
        options.generator = GeneratorKind::Uniform;
        options.seed = 42u;
        auto a = makeGenerator(options);
        auto b = makeGenerator(options);
        REQUIRE(a->sample(0.01) == b->sample(0.01));
    }

    SECTION("gaussian validates its deviation") {
        options.generator = GeneratorKind::Gaussian;
        options.stdDev = -1.0;
        REQUIRE_THROWS_AS(makeGenerator(options), InvalidParameter);
    }
}

TEST_CASE("makeFilter builds the selected filter", "[signal_bench][pipeline]") {
    BenchOptions options;
    REQUIRE(makeFilter(options) == nullptr);

    options.filter = FilterKind::LowPass;
    options.cutoff = 5.0;
    options.initValue = 2.0;
    auto lpf = makeFilter(options);
    auto* asLowPass = dynamic_cast<Kinetic::DSP::LowPassFilter*>(lpf.get());
    REQUIRE(asLowPass != nullptr);
    REQUIRE(asLowPass->cutoffFreq() == 5.0);
    REQUIRE(asLowPass->previousOutput() == 2.0);

    options.filter = FilterKind::BandPass;
    options.lowCutoff = 10.0;
    options.highCutoff = 1.0;
    REQUIRE_THROWS_AS(makeFilter(options), InvalidParameter);
}

TEST_CASE("runBench writes a CSV with t, raw and filtered columns", "[signal_bench][pipeline]") {
    BenchOptions options;
    options.generator = GeneratorKind::Square;
    options.freq = 1.0;
    options.dt = 0.25;
    options.count = 4;

    std::ostringstream out;
    std::ostringstream log;
    REQUIRE(runBench(options, out, log) == 4);

    const auto rows = splitRows(out.str());
    REQUIRE(rows.size() == 5);
    REQUIRE(rows[0] == "t,raw,filtered");

    const std::vector<double> expectedRaw = {1.0, 0.0, 0.0, 1.0};
    for (size_t i = 0; i < 4; ++i) {
        const auto fields = splitFields(rows[i + 1]);
        REQUIRE(fields.size() == 3);
        REQUIRE(fields[0] == Approx(0.25 * static_cast<double>(i + 1)));
        REQUIRE(fields[1] == expectedRaw[i]);
        REQUIRE(fields[2] == fields[1]);
    }
    REQUIRE(log.str().empty());
}

TEST_CASE("runBench filters the raw column", "[signal_bench][pipeline]") {
    BenchOptions options;
    options.generator = GeneratorKind::Square;
    options.freq = 1.0;
    options.filter = FilterKind::LowPass;
    options.cutoff = 1.0;
    options.dt = 0.01;
    options.count = 50;

    std::ostringstream out;
    std::ostringstream log;
    (void)runBench(options, out, log);

    Kinetic::DSP::SquareWaveGenerator square({.freq = 1.0});
    Kinetic::DSP::LowPassFilter lpf(1.0);
    const auto rows = splitRows(out.str());
    for (size_t i = 1; i < rows.size(); ++i) {
        const auto fields = splitFields(rows[i]);
        const double raw = square.sample(0.01);
        REQUIRE(fields[1] == raw);
        REQUIRE(fields[2] == Approx(lpf.filter(raw, 0.01)));
    }
}

TEST_CASE("runBench logs configuration and progress when verbose", "[signal_bench][pipeline]") {
    BenchOptions options;
    options.verbose = true;
    options.count = 20;

    std::ostringstream out;
    std::ostringstream log;
    (void)runBench(options, out, log);

    REQUIRE_THAT(log.str(), StartsWith("[signal_bench] generator=sine"));
    REQUIRE_THAT(log.str(), ContainsSubstring("dt=0.01 count=20"));
    REQUIRE_THAT(log.str(), ContainsSubstring("20/20 samples"));
}

TEST_CASE("runBench rejects an invalid dt before writing", "[signal_bench][pipeline][error]") {
    BenchOptions options;
    options.dt = -0.01;

    std::ostringstream out;
    std::ostringstream log;
    REQUIRE_THROWS_AS(runBench(options, out, log), InvalidParameter);
    REQUIRE(out.str().empty());
}
