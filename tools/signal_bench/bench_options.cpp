// =============================================================================
// Signal Bench - Command-Line Options Implementation
// =============================================================================

#include "bench_options.h"

#include <cstddef>
#include <limits>

namespace SignalBench {

namespace {

// Pulls the value that follows a flag, or fails with the flag's name.
class ArgumentCursor {
public:
    explicit ArgumentCursor(const std::vector<std::string>& args)
        : args_(args) {}

    [[nodiscard]] bool done() const noexcept { return index_ >= args_.size(); }

    const std::string& next() { return args_[index_++]; }

    const std::string& valueFor(const std::string& flag) {
        if (done()) {
            throw UsageError("missing value for " + flag);
        }
        return next();
    }

private:
    const std::vector<std::string>& args_;
    size_t index_ = 0;
};

double parseDouble(const std::string& flag, const std::string& text) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::logic_error&) {
        // std::invalid_argument and std::out_of_range
        throw UsageError("malformed number for " + flag + ": '" + text + "'");
    }
    if (consumed != text.size()) {
        throw UsageError("malformed number for " + flag + ": '" + text + "'");
    }
    return value;
}

unsigned long long parseUnsigned(const std::string& flag,
                                 const std::string& text,
                                 unsigned long long maxValue) {
    if (text.empty() || text.front() == '-' || text.front() == '+') {
        throw UsageError("expected a non-negative integer for " + flag + ": '" + text + "'");
    }
    size_t consumed = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &consumed);
    } catch (const std::logic_error&) {
        throw UsageError("malformed integer for " + flag + ": '" + text + "'");
    }
    if (consumed != text.size() || value > maxValue) {
        throw UsageError("malformed integer for " + flag + ": '" + text + "'");
    }
    return value;
}

GeneratorKind parseGenerator(const std::string& name) {
    if (name == "sine") return GeneratorKind::Sine;
    if (name == "square") return GeneratorKind::Square;
    if (name == "triangle") return GeneratorKind::Triangle;
    if (name == "uniform") return GeneratorKind::Uniform;
    if (name == "gaussian") return GeneratorKind::Gaussian;
    throw UsageError("unknown generator '" + name + "'");
}

FilterKind parseFilter(const std::string& name) {
    if (name == "none") return FilterKind::None;
    if (name == "lowpass") return FilterKind::LowPass;
    if (name == "highpass") return FilterKind::HighPass;
    if (name == "bandpass") return FilterKind::BandPass;
    if (name == "bandstop") return FilterKind::BandStop;
    throw UsageError("unknown filter '" + name + "'");
}

void requireCutoffs(const BenchOptions& options) {
    switch (options.filter) {
        case FilterKind::None:
            break;
        case FilterKind::LowPass:
        case FilterKind::HighPass:
            if (!options.cutoff) {
                throw UsageError(std::string("--filter ") + filterName(options.filter)
                                 + " requires --cutoff");
            }
            break;
        case FilterKind::BandPass:
        case FilterKind::BandStop:
            if (!options.lowCutoff || !options.highCutoff) {
                throw UsageError(std::string("--filter ") + filterName(options.filter)
                                 + " requires --low-cutoff and --high-cutoff");
            }
            break;
    }
}

} // anonymous namespace

BenchOptions parseArguments(const std::vector<std::string>& args) {
    BenchOptions options;
    ArgumentCursor cursor(args);

    while (!cursor.done()) {
        const std::string& flag = cursor.next();

        if (flag == "--help" || flag == "-h") {
            options.help = true;
            return options;
        }
        if (flag == "--verbose" || flag == "-v") {
            options.verbose = true;
        } else if (flag == "--generator") {
            options.generator = parseGenerator(cursor.valueFor(flag));
        } else if (flag == "--freq") {
            options.freq = parseDouble(flag, cursor.valueFor(flag));
        } else if (flag == "--period") {
            options.period = parseDouble(flag, cursor.valueFor(flag));
        } else if (flag == "--duty-cycle") {
            options.dutyCycle = parseDouble(flag, cursor.valueFor(flag));
        } else if (flag == "--low") {
            options.low = parseDouble(flag, cursor.valueFor(flag));
        } else if (flag == "--high") {
            options.high = parseDouble(flag, cursor.valueFor(flag));
        } else if (flag == "--mean") {
            options.mean = parseDouble(flag, cursor.valueFor(flag));
        } else if (flag == "--std-dev") {
            options.stdDev = parseDouble(flag, cursor.valueFor(flag));
        } else if (flag == "--seed") {
            options.seed = static_cast<uint64_t>(parseUnsigned(
                flag, cursor.valueFor(flag), std::numeric_limits<uint64_t>::max()));
        } else if (flag == "--randomness") {
            options.randomness = Kinetic::DSP::parseRandomness(cursor.valueFor(flag));
        } else if (flag == "--filter") {
            options.filter = parseFilter(cursor.valueFor(flag));
        } else if (flag == "--cutoff") {
            options.cutoff = parseDouble(flag, cursor.valueFor(flag));
        } else if (flag == "--low-cutoff") {
            options.lowCutoff = parseDouble(flag, cursor.valueFor(flag));
        } else if (flag == "--high-cutoff") {
            options.highCutoff = parseDouble(flag, cursor.valueFor(flag));
        } else if (flag == "--init-value") {
            options.initValue = parseDouble(flag, cursor.valueFor(flag));
        } else if (flag == "--dt") {
            options.dt = parseDouble(flag, cursor.valueFor(flag));
        } else if (flag == "--count") {
            options.count = static_cast<size_t>(parseUnsigned(
                flag, cursor.valueFor(flag), std::numeric_limits<size_t>::max()));
        } else {
            throw UsageError("unknown option '" + flag + "'");
        }
    }

    requireCutoffs(options);
    return options;
}

BenchOptions parseArguments(int argc, const char* const* argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parseArguments(args);
}

void printUsage(std::ostream& os) {
    os << "Usage: signal_bench [options]\n"
          "\n"
          "Samples a signal generator, optionally runs it through a filter, and\n"
          "writes CSV (t,raw,filtered) to stdout.\n"
          "\n"
          "Generator:\n"
          "  --generator NAME    sine|square|triangle|uniform|gaussian (default sine)\n"
          "  --freq HZ           periodic frequency (default 1 when --period is absent)\n"
          "  --period S          periodic period\n"
          "  --duty-cycle D      square/triangle duty cycle in [0, 1] (default 0.5)\n"
          "  --low L --high H    uniform range (default 0 1)\n"
          "  --mean M            gaussian mean (default 0)\n"
          "  --std-dev S         gaussian standard deviation (default 1)\n"
          "  --seed N            pseudo-random seed (default: from the OS)\n"
          "  --randomness KIND   pseudo|true (default pseudo)\n"
          "\n"
          "Filter:\n"
          "  --filter NAME       none|lowpass|highpass|bandpass|bandstop (default none)\n"
          "  --cutoff HZ         lowpass/highpass cutoff\n"
          "  --low-cutoff HZ     bandpass/bandstop low cutoff\n"
          "  --high-cutoff HZ    bandpass/bandstop high cutoff\n"
          "  --init-value V      filter seed value (default 0)\n"
          "\n"
          "Run:\n"
          "  --dt S              timestep in seconds (default 0.01)\n"
          "  --count N           number of samples (default 100)\n"
          "  --verbose, -v       log configuration and progress to stderr\n"
          "  --help, -h          show this message\n";
}

const char* generatorName(GeneratorKind kind) noexcept {
    switch (kind) {
        case GeneratorKind::Sine: return "sine";
        case GeneratorKind::Square: return "square";
        case GeneratorKind::Triangle: return "triangle";
        case GeneratorKind::Uniform: return "uniform";
        case GeneratorKind::Gaussian: return "gaussian";
    }
    return "unknown";
}

const char* filterName(FilterKind kind) noexcept {
    switch (kind) {
        case FilterKind::None: return "none";
        case FilterKind::LowPass: return "lowpass";
        case FilterKind::HighPass: return "highpass";
        case FilterKind::BandPass: return "bandpass";
        case FilterKind::BandStop: return "bandstop";
    }
    return "unknown";
}

} // namespace SignalBench
