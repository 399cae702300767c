// ==============================================================================
// Layer 2: DSP Processor - Spectral Sampler
// ==============================================================================
// Samples a response curve on numBins uniform bins spanning [0, nyquist]
// inclusive and attaches an independent uniform random phase in [0, 2*pi) to
// every bin:
//
//   f[k] = k * nyquist / (numBins - 1)
//   X[k] = curve(f[k]) * exp(i * phase[k])
//
// Phases come from the generator handed to sample(); the sampler holds no
// random state of its own.
// ==============================================================================

#pragma once

#include <shapenoise/dsp/core/math_constants.h>
#include <shapenoise/dsp/core/random.h>
#include <shapenoise/dsp/core/spectral_simd.h>
#include <shapenoise/dsp/core/synthesis_error.h>
#include <shapenoise/dsp/primitives/fft.h>
#include <shapenoise/dsp/primitives/response_curve.h>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace Shapenoise {
namespace DSP {

/// @brief Layer 2 DSP Processor - magnitude sampling with random phase
///
/// @par Dependencies
/// - Layer 0: random.h (Xorshift32), spectral_simd.h (reconstructCartesianBulk)
/// - Layer 1: ResponseCurve, Complex
///
/// Scratch buffers are kept between calls, so one sampler instance is not
/// safe to share across threads.
class SpectralSampler {
public:
    SpectralSampler() = default;

    /// @brief Frequency of bin k on a grid of numBins bins over [0, nyquist]
    /// @note The last bin is exactly nyquist
    [[nodiscard]] static double binFrequency(size_t k, size_t numBins, double nyquist) noexcept {
        if (numBins < 2) return 0.0;
        if (k + 1 == numBins) return nyquist;
        return static_cast<double>(k) * nyquist / static_cast<double>(numBins - 1);
    }

    /// @brief Sample the curve and attach random phases
    /// @param curve Response covering [0, nyquist]
    /// @param nyquist Highest bin frequency (Hz)
    /// @param numBins Number of bins, >= 2
    /// @param rng Phase source; advanced by exactly numBins draws
    /// @return numBins complex bins, or DomainError if the curve does not
    ///         cover the grid
    [[nodiscard]] Result<std::vector<Complex>> sample(const ResponseCurve& curve,
                                                      double nyquist,
                                                      size_t numBins,
                                                      Xorshift32& rng) {
        using SampleResult = Result<std::vector<Complex>>;

        if (numBins < 2) {
            return SampleResult::failure(SynthesisError::ConfigError,
                "at least two frequency bins are required, got " + std::to_string(numBins));
        }

        frequencies_.resize(numBins);
        magnitudes_.resize(numBins);
        phases_.resize(numBins);
        interleaved_.resize(2 * numBins);

        for (size_t k = 0; k < numBins; ++k) {
            frequencies_[k] = binFrequency(k, numBins, nyquist);
        }

        const Status evaluated = curve.evaluateAscending(frequencies_.data(), numBins,
                                                         magnitudes_.data());
        if (!evaluated) return SampleResult::failure(evaluated);

        for (size_t k = 0; k < numBins; ++k) {
            phases_[k] = kTwoPi * rng.nextUnitFloat();
        }

        reconstructCartesianBulk(magnitudes_.data(), phases_.data(), numBins,
                                 interleaved_.data());

        std::vector<Complex> bins(numBins);
        for (size_t k = 0; k < numBins; ++k) {
            bins[k] = {interleaved_[2 * k], interleaved_[2 * k + 1]};
        }
        return SampleResult::success(std::move(bins));
    }

    /// Magnitudes from the most recent sample() call
    [[nodiscard]] const std::vector<float>& magnitudes() const noexcept { return magnitudes_; }

    /// Phases (radians) from the most recent sample() call
    [[nodiscard]] const std::vector<float>& phases() const noexcept { return phases_; }

private:
    std::vector<double> frequencies_;
    std::vector<float> magnitudes_;
    std::vector<float> phases_;
    std::vector<float> interleaved_;
};

} // namespace DSP
} // namespace Shapenoise
