// ==============================================================================
// Layer 0: Core Utility - SIMD-Accelerated Spectral Math
// ==============================================================================
// Bulk Cartesian reconstruction using Google Highway for runtime SIMD
// dispatch (SSE2/AVX2/AVX-512/NEON).
//
// The vectorized equivalent of per-bin cos/sin. SpectralSampler calls
// reconstructCartesianBulk to turn sampled magnitudes and random phases into
// complex bins.
// ==============================================================================

#pragma once

#include <cstddef>

namespace Shapenoise {
namespace DSP {

/// @brief Bulk reconstruct interleaved Complex data from magnitude and phase
/// @param mags Input magnitude array
/// @param phases Input phase array in radians
/// @param numBins Number of complex bins (NOT number of floats)
/// @param complexData Output interleaved {real, imag} float pairs (must hold 2*numBins floats)
/// @note SIMD-accelerated with runtime ISA dispatch
void reconstructCartesianBulk(const float* mags, const float* phases,
                              size_t numBins, float* complexData) noexcept;

} // namespace DSP
} // namespace Shapenoise
