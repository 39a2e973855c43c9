// =============================================================================
// Signal Bench - Main Entry Point
// =============================================================================
// Command-line harness for the Kinetic DSP generators and filters. Samples a
// generator at a fixed timestep, optionally filters it, and prints CSV.
//
// Usage:
//   signal_bench --generator square --freq 2 --filter lowpass --cutoff 5
//                --dt 0.001 --count 2000 > square_lp.csv
//
// Exit status:
//   0  success
//   1  invalid parameter (rejected by a DSP constructor or setter)
//   2  malformed command line
// =============================================================================

#include "bench_options.h"
#include "bench_runner.h"

#include <kinetic/dsp/core/parameter_validation.h>

#include <iostream>

int main(int argc, char* argv[]) {
    SignalBench::BenchOptions options;

    try {
        options = SignalBench::parseArguments(argc, argv);
    } catch (const SignalBench::UsageError& e) {
        std::cerr << "signal_bench: " << e.what() << "\n\n";
        SignalBench::printUsage(std::cerr);
        return 2;
    } catch (const Kinetic::DSP::InvalidParameter& e) {
        std::cerr << "signal_bench: " << e.what() << std::endl;
        return 1;
    }

    if (options.help) {
        SignalBench::printUsage(std::cout);
        return 0;
    }

    try {
        const size_t rows = SignalBench::runBench(options, std::cout, std::cerr);
        if (options.verbose) {
            std::cerr << "[signal_bench] wrote " << rows << " rows" << std::endl;
        }
    } catch (const Kinetic::DSP::InvalidParameter& e) {
        std::cerr << "signal_bench: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
