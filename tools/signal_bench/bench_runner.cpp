// =============================================================================
// Signal Bench - Generator/Filter Pipeline Implementation
// =============================================================================

#include "bench_runner.h"

#include <kinetic/dsp/core/parameter_validation.h>
#include <kinetic/dsp/primitives/band_filters.h>
#include <kinetic/dsp/primitives/one_pole.h>
#include <kinetic/dsp/primitives/periodic_generators.h>
#include <kinetic/dsp/primitives/random_generators.h>
#include <kinetic/dsp/primitives/sample_sequence.h>

#include <ios>
#include <limits>

namespace SignalBench {

using namespace Kinetic::DSP;

namespace {

PeriodicTiming timingFrom(const BenchOptions& options) {
    PeriodicTiming timing{options.freq, options.period};
    if (!timing.freq && !timing.period) {
        timing.freq = 1.0;
    }
    return timing;
}

void logConfiguration(const BenchOptions& options, std::ostream& log) {
    log << "[signal_bench] generator=" << generatorName(options.generator);
    switch (options.generator) {
        case GeneratorKind::Sine:
        case GeneratorKind::Square:
        case GeneratorKind::Triangle:
            if (options.period) {
                log << " period=" << *options.period;
            } else {
                log << " freq=" << options.freq.value_or(1.0);
            }
            if (options.generator != GeneratorKind::Sine) {
                log << " duty_cycle=" << options.dutyCycle;
            }
            break;
        case GeneratorKind::Uniform:
            log << " low=" << options.low << " high=" << options.high;
            break;
        case GeneratorKind::Gaussian:
            log << " mean=" << options.mean << " std_dev=" << options.stdDev;
            break;
    }
    if (options.generator == GeneratorKind::Uniform
        || options.generator == GeneratorKind::Gaussian) {
        log << " randomness=" << randomnessName(options.randomness);
        if (options.seed) {
            log << " seed=" << *options.seed;
        }
    }
    log << '\n';

    log << "[signal_bench] filter=" << filterName(options.filter);
    if (options.cutoff) {
        log << " cutoff=" << *options.cutoff;
    }
    if (options.lowCutoff) {
        log << " low_cutoff=" << *options.lowCutoff;
    }
    if (options.highCutoff) {
        log << " high_cutoff=" << *options.highCutoff;
    }
    log << " init_value=" << options.initValue << '\n';
    log << "[signal_bench] dt=" << options.dt << " count=" << options.count << '\n';
}

} // anonymous namespace

std::unique_ptr<SignalGenerator> makeGenerator(const BenchOptions& options) {
    switch (options.generator) {
        case GeneratorKind::Sine:
            return std::make_unique<SineWaveGenerator>(timingFrom(options));
        case GeneratorKind::Square:
            return std::make_unique<SquareWaveGenerator>(timingFrom(options), options.dutyCycle);
        case GeneratorKind::Triangle:
            return std::make_unique<TriangleWaveGenerator>(timingFrom(options), options.dutyCycle);
        case GeneratorKind::Uniform:
            return std::make_unique<UniformRandomSignalGenerator>(
                options.low, options.high, options.seed, options.randomness);
        case GeneratorKind::Gaussian:
            return std::make_unique<GaussianRandomSignalGenerator>(
                options.mean, options.stdDev, options.seed, options.randomness);
    }
    throw InvalidParameter("unknown generator kind.");
}

std::unique_ptr<Filter> makeFilter(const BenchOptions& options) {
    switch (options.filter) {
        case FilterKind::None:
            return nullptr;
        case FilterKind::LowPass:
            return std::make_unique<LowPassFilter>(options.cutoff.value_or(0.0),
                                                   options.initValue);
        case FilterKind::HighPass:
            return std::make_unique<HighPassFilter>(options.cutoff.value_or(0.0),
                                                    options.initValue);
        case FilterKind::BandPass:
            return std::make_unique<BandPassFilter>(options.lowCutoff.value_or(0.0),
                                                    options.highCutoff.value_or(0.0),
                                                    options.initValue);
        case FilterKind::BandStop:
            return std::make_unique<BandStopFilter>(options.lowCutoff.value_or(0.0),
                                                    options.highCutoff.value_or(0.0),
                                                    options.initValue);
    }
    throw InvalidParameter("unknown filter kind.");
}

size_t runBench(const BenchOptions& options, std::ostream& out, std::ostream& log) {
    // Reject a bad dt before any output is written.
    validateTimestep(options.dt);

    auto generator = makeGenerator(options);
    auto filter = makeFilter(options);

    if (options.verbose) {
        logConfiguration(options, log);
    }

    const auto savedPrecision = out.precision(std::numeric_limits<double>::max_digits10);
    out << "t,raw,filtered\n";

    // Progress roughly every 10% of the run
    const size_t progressStep = options.count >= 10 ? options.count / 10 : 1;

    double t = 0.0;
    size_t rows = 0;
    for (double raw : sampleSequence(*generator, options.dt, options.count)) {
        t += options.dt;
        const double filtered = filter ? filter->filter(raw, options.dt) : raw;
        out << t << ',' << raw << ',' << filtered << '\n';
        ++rows;

        if (options.verbose && rows % progressStep == 0) {
            log << "[signal_bench] " << rows << '/' << options.count << " samples\n";
        }
    }

    out.precision(savedPrecision);
    out.flush();
    return rows;
}

} // namespace SignalBench
