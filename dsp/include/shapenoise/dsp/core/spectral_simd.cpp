// ==============================================================================
// Layer 0: Core Utility - SIMD-Accelerated Spectral Math
// ==============================================================================
// Highway kernel behind spectral_simd.h. The sampler converts every
// (magnitude, phase) bin of a multi-second spectrum, so the sin/cos pair is
// the hot loop of synthesis.
//
// This file uses Highway's self-inclusion pattern: foreach_target.h re-includes
// this file once per ISA target. The SIMD kernels compile for each target;
// HWY_EXPORT/HWY_DYNAMIC_DISPATCH (inside #if HWY_ONCE) select the best at
// runtime.
// ==============================================================================

#undef HWY_TARGET_INCLUDE
#define HWY_TARGET_INCLUDE "shapenoise/dsp/core/spectral_simd.cpp"
#include "hwy/foreach_target.h"  // NOLINT(misc-header-include-cycle) Highway self-inclusion
#include "hwy/highway.h"
#include "hwy/contrib/math/math-inl.h"

#include <cmath>
#include <cstddef>

// =============================================================================
// Per-Target SIMD Kernels (compiled once per ISA target)
// =============================================================================

HWY_BEFORE_NAMESPACE();

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE is a macro
namespace Shapenoise {
namespace DSP {
namespace HWY_NAMESPACE {

namespace hn = hwy::HWY_NAMESPACE;

// -----------------------------------------------------------------------------
// CartesianFromPolarKernel: mags[] + phases[] -> Complex[]
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void CartesianFromPolarKernel(const float* HWY_RESTRICT mags,
                               const float* HWY_RESTRICT phases,
                               size_t numBins,
                               float* HWY_RESTRICT complexData) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);

    size_t k = 0;

    // SIMD loop: process N bins per iteration
    for (; k + N <= numBins; k += N) {
        const auto mag = hn::Load(d, mags + k);
        const auto phase = hn::Load(d, phases + k);

        // Compute sin(phase) and cos(phase)
        const auto sinVal = hn::Sin(d, phase);
        const auto cosVal = hn::Cos(d, phase);

        // re = mag * cos(phase), im = mag * sin(phase)
        const auto re = hn::Mul(mag, cosVal);
        const auto im = hn::Mul(mag, sinVal);

        // Store as interleaved [real0, imag0, real1, imag1, ...]
        hn::StoreInterleaved2(re, im, d, complexData + k * 2);
    }

    // Scalar tail for remaining bins
    for (; k < numBins; ++k) {
        complexData[k * 2] = mags[k] * std::cos(phases[k]);
        complexData[k * 2 + 1] = mags[k] * std::sin(phases[k]);
    }
}

}  // namespace HWY_NAMESPACE
}  // namespace DSP
}  // namespace Shapenoise

HWY_AFTER_NAMESPACE();

// =============================================================================
// Dispatch Table + Wrapper Functions (compiled once)
// =============================================================================

#if HWY_ONCE

#include "shapenoise/dsp/core/spectral_simd.h"

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE dispatch section
namespace Shapenoise {
namespace DSP {

HWY_EXPORT(CartesianFromPolarKernel);

void reconstructCartesianBulk(const float* mags, const float* phases,
                               size_t numBins, float* complexData) noexcept {
    HWY_DYNAMIC_DISPATCH(CartesianFromPolarKernel)(mags, phases, numBins, complexData);
}

}  // namespace DSP
}  // namespace Shapenoise

#endif  // HWY_ONCE
