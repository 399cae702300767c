// ==============================================================================
// Layer 2: DSP Processor - Signal Reconstructor
// ==============================================================================
// Turns n positive-frequency bins (0..nyquist inclusive) into a real signal of
// N = 2n - 2 samples:
//
//   full[k]     = half[k]                 k = 0 .. n-1
//   full[N - k] = conj(half[k])           k = 1 .. n-2
//   x[t]        = Re(IDFT(full)[t])
//
// The 0 Hz and nyquist bins are not mirrored. Their imaginary parts only
// produce an imaginary residue in the IDFT, which is discarded with the rest
// of the numerical imaginary noise.
// ==============================================================================

#pragma once

#include <shapenoise/dsp/core/synthesis_error.h>
#include <shapenoise/dsp/primitives/fft.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace Shapenoise {
namespace DSP {

/// @brief Layer 2 DSP Processor - Hermitian mirroring + inverse FFT
///
/// The FFT plan is kept and reused while consecutive calls have the same
/// length.
class SignalReconstructor {
public:
    SignalReconstructor() = default;

    // Non-copyable (owns an FFT), movable
    SignalReconstructor(const SignalReconstructor&) = delete;
    SignalReconstructor& operator=(const SignalReconstructor&) = delete;
    SignalReconstructor(SignalReconstructor&&) noexcept = default;
    SignalReconstructor& operator=(SignalReconstructor&&) noexcept = default;

    /// @brief Number of time samples produced from numBins positive bins
    [[nodiscard]] static constexpr size_t outputLength(size_t numBins) noexcept {
        return numBins < 2 ? 0 : 2 * numBins - 2;
    }

    /// @brief Mirror the interior bins as conjugates to form the full spectrum
    /// @return 2n - 2 bins; empty if fewer than two bins are given
    [[nodiscard]] static std::vector<Complex> buildSymmetricSpectrum(
        const std::vector<Complex>& halfSpectrum) {
        const size_t n = halfSpectrum.size();
        const size_t total = outputLength(n);
        std::vector<Complex> full(total);
        if (total == 0) return full;

        std::copy(halfSpectrum.begin(), halfSpectrum.end(), full.begin());
        for (size_t k = 1; k + 1 < n; ++k) {
            full[total - k] = halfSpectrum[k].conjugate();
        }
        return full;
    }

    /// @brief Reconstruct the real time-domain signal
    /// @return 2n - 2 samples, ConfigError for fewer than two bins, FftError
    ///         if the transform cannot be prepared
    [[nodiscard]] Result<std::vector<float>> reconstruct(const std::vector<Complex>& halfSpectrum) {
        using SignalResult = Result<std::vector<float>>;

        if (halfSpectrum.size() < 2) {
            return SignalResult::failure(SynthesisError::ConfigError,
                "at least two frequency bins are required, got "
                + std::to_string(halfSpectrum.size()));
        }

        const std::vector<Complex> full = buildSymmetricSpectrum(halfSpectrum);
        const size_t total = full.size();

        if (fft_.size() != total && !fft_.prepare(total)) {
            return SignalResult::failure(SynthesisError::FftError,
                "could not prepare an inverse FFT of size " + std::to_string(total));
        }

        timeDomain_.resize(total);
        fft_.inverse(full.data(), timeDomain_.data());

        std::vector<float> signal(total);
        float residue = 0.0f;
        for (size_t t = 0; t < total; ++t) {
            signal[t] = timeDomain_[t].real;
            residue = std::max(residue, std::abs(timeDomain_[t].imag));
        }
        imaginaryResidue_ = residue;

        return SignalResult::success(std::move(signal));
    }

    /// Largest |imag| discarded by the most recent reconstruct() call
    [[nodiscard]] float imaginaryResidue() const noexcept { return imaginaryResidue_; }

    /// True if the most recent reconstruct() ran on FFTW rather than pffft
    [[nodiscard]] bool usedFftw() const noexcept { return fft_.usesFftw(); }

private:
    FFT fft_;
    std::vector<Complex> timeDomain_;
    float imaginaryResidue_ = 0.0f;
};

} // namespace DSP
} // namespace Shapenoise
