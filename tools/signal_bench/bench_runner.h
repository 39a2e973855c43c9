// =============================================================================
// Signal Bench - Generator/Filter Pipeline
// =============================================================================
// Builds the DSP objects named by BenchOptions and streams their output as
// CSV. Construction failures surface as Kinetic::DSP::InvalidParameter.
// =============================================================================

#pragma once

#include "bench_options.h"

#include <kinetic/dsp/primitives/filter.h>
#include <kinetic/dsp/primitives/signal_generator.h>

#include <memory>
#include <ostream>

namespace SignalBench {

/// @throws Kinetic::DSP::InvalidParameter on invalid generator parameters
[[nodiscard]] std::unique_ptr<Kinetic::DSP::SignalGenerator> makeGenerator(
    const BenchOptions& options);

/// @return nullptr for FilterKind::None
/// @throws Kinetic::DSP::InvalidParameter on invalid cutoffs
[[nodiscard]] std::unique_ptr<Kinetic::DSP::Filter> makeFilter(const BenchOptions& options);

/// @brief Sample options.count values and write "t,raw,filtered" rows to out.
///
/// Configuration and progress go to log when options.verbose is set.
///
/// @return Number of rows written (excluding the header)
/// @throws Kinetic::DSP::InvalidParameter on invalid configuration or dt
size_t runBench(const BenchOptions& options, std::ostream& out, std::ostream& log);

} // namespace SignalBench
