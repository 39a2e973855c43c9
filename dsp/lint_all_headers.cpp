// ==============================================================================
// KineticDSP Lint Stub - Strict analysis of all public headers
// ==============================================================================
// This file exists solely to give clang-tidy and the compiler a .cpp
// translation unit that includes every public DSP header, so that each header
// is checked for self-containment even though the library is header-only.
//
// This file is NOT part of the KineticDSP library itself; it is compiled as a
// separate OBJECT library target (dsp_lint_stub) for compile_commands.json.
// ==============================================================================

// Layer 0: Core
#include <kinetic/dsp/core/math_constants.h>
#include <kinetic/dsp/core/parameter_validation.h>
#include <kinetic/dsp/core/random.h>

// Layer 1: Primitives
#include <kinetic/dsp/primitives/band_filters.h>
#include <kinetic/dsp/primitives/filter.h>
#include <kinetic/dsp/primitives/one_pole.h>
#include <kinetic/dsp/primitives/periodic_generators.h>
#include <kinetic/dsp/primitives/random_generators.h>
#include <kinetic/dsp/primitives/sample_sequence.h>
#include <kinetic/dsp/primitives/signal_generator.h>
