// ==============================================================================
// Layer 3: System Component - Spectral Noise Synthesizer
// ==============================================================================
// Synthesizes a time-domain noise signal whose magnitude spectrum follows a
// piecewise-linear response given by control points:
//
//   control points -> BoundaryExtender -> ResponseCurve -> SpectralSampler
//                  -> SignalReconstructor -> peak normalization
//
// Composes:
// - BoundaryExtender (Layer 2): extension to [0, nyquist]
// - ResponseCurve (Layer 1): sorted linear interpolant
// - SpectralSampler (Layer 2): magnitudes + random phase per bin
// - SignalReconstructor (Layer 2): Hermitian mirror + inverse FFT
//
// The bin count ties the output length to the request:
//   numBins    = duration * nyquist + 1
//   numSamples = 2 * numBins - 2 = duration * sampleRate
// ==============================================================================

#pragma once

#include <shapenoise/dsp/core/boundary_policy.h>
#include <shapenoise/dsp/core/control_point.h>
#include <shapenoise/dsp/core/random.h>
#include <shapenoise/dsp/core/synthesis_error.h>
#include <shapenoise/dsp/primitives/response_curve.h>
#include <shapenoise/dsp/processors/boundary_extender.h>
#include <shapenoise/dsp/processors/signal_reconstructor.h>
#include <shapenoise/dsp/processors/spectral_sampler.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Shapenoise {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// Default signal duration (seconds)
inline constexpr double kDefaultDuration = 10.0;

/// Default output peak, as a fraction of full scale
inline constexpr float kDefaultPeakLevel = 0.8f;

/// Relative tolerance when checking that duration * nyquist is a whole number
inline constexpr double kWholeNumberTolerance = 1e-9;

/// Highest sample rate (Hz) a mono float32 WAV header can carry: the fmt
/// chunk stores rate * 4 bytes in 32 bits
inline constexpr uint32_t kMaxSampleRate = UINT32_MAX / 4;

// =============================================================================
// Request / Result Types
// =============================================================================

/// @brief Everything needed to synthesize one shaped-noise signal
///
/// At least one of nyquist and sampleRate must be set; if both are set,
/// nyquist must equal sampleRate / 2.
struct NoiseRequest {
    std::vector<double> frequencies;                   ///< Control frequencies (Hz)
    std::vector<double> responses;                     ///< Magnitudes at those frequencies
    std::optional<double> nyquist;                     ///< Upper spectrum limit (Hz)
    std::optional<double> sampleRate;                  ///< Output rate (Hz)
    double duration = kDefaultDuration;                ///< Seconds
    BoundaryPolicy lowerBoundary = kDefaultBoundaryPolicy;
    BoundaryPolicy upperBoundary = kDefaultBoundaryPolicy;
    double epsilon = kDefaultBoundaryEpsilon;          ///< Zero-boundary cutoff distance (Hz)
    float peakLevel = kDefaultPeakLevel;               ///< Normalized peak |sample|
};

/// @brief Rates and sizes resolved from a NoiseRequest
struct RateInfo {
    double nyquist = 0.0;
    double sampleRate = 0.0;
    size_t numBins = 0;     ///< Positive-frequency bins, 0..nyquist inclusive
    size_t numSamples = 0;  ///< Time-domain samples, == duration * sampleRate
};

/// @brief Real time-domain signal at a fixed sample rate
struct SynthesizedSignal {
    std::vector<float> samples;
    double sampleRate = 0.0;

    /// Time of sample i in seconds (i / sampleRate)
    [[nodiscard]] double timeAt(size_t i) const noexcept {
        return static_cast<double>(i) / sampleRate;
    }

    /// Times of every sample, starting at 0 and spaced 1 / sampleRate apart
    [[nodiscard]] std::vector<double> timeAxis() const {
        std::vector<double> times(samples.size());
        for (size_t i = 0; i < times.size(); ++i) {
            times[i] = timeAt(i);
        }
        return times;
    }
};

// =============================================================================
// Normalization
// =============================================================================

/// @brief Scale samples so that max |sample| == peak
/// @return SilentSignal if every sample is zero (nothing to scale)
[[nodiscard]] inline Status normalizePeak(std::vector<float>& samples, float peak) {
    float maxAbs = 0.0f;
    for (float s : samples) {
        maxAbs = std::max(maxAbs, std::abs(s));
    }
    if (!(maxAbs > 0.0f) || !std::isfinite(maxAbs)) {
        return Status::failure(SynthesisError::SilentSignal,
            "signal has no nonzero samples to normalize; the sampled response is zero on every bin");
    }

    const double scale = static_cast<double>(peak) / static_cast<double>(maxAbs);
    for (float& s : samples) {
        s = static_cast<float>(static_cast<double>(s) * scale);
    }
    return Status::success();
}

// =============================================================================
// SpectralNoiseSynthesizer Class
// =============================================================================

/// @brief Layer 3 System - shaped noise from a piecewise-linear response
///
/// @par Thread Safety
/// An instance keeps FFT plans and scratch buffers; use one instance (and one
/// generator) per thread.
///
/// @par Usage
/// @code
/// NoiseRequest request;
/// request.frequencies = {2000.0, 6000.0};
/// request.responses = {1.0, 1.0};
/// request.nyquist = 8000.0;
/// request.lowerBoundary = BoundaryPolicy::Zero;
/// request.upperBoundary = BoundaryPolicy::Zero;
///
/// Xorshift32 rng(42);
/// SpectralNoiseSynthesizer synth;
/// auto signal = synth.render(request, rng);  // 160000 samples, peak 0.8
/// @endcode
class SpectralNoiseSynthesizer {
public:
    SpectralNoiseSynthesizer() = default;

    // -------------------------------------------------------------------------
    // Validation
    // -------------------------------------------------------------------------

    /// @brief Resolve nyquist / sampleRate and derive bin and sample counts
    /// @return ConfigError for a missing, inconsistent or non-positive rate,
    ///         a non-positive duration, a sample rate that is not whole Hz, or
    ///         a duration * nyquist that is not a whole number >= 1;
    ///         DomainError if a control frequency exceeds nyquist
    [[nodiscard]] static Result<RateInfo> resolveRates(const NoiseRequest& request) {
        using RateResult = Result<RateInfo>;

        if (!request.nyquist && !request.sampleRate) {
            return RateResult::failure(SynthesisError::ConfigError,
                "either nyquist or sampling_rate must be provided");
        }
        if (request.nyquist && !isPositiveFinite(*request.nyquist)) {
            return RateResult::failure(SynthesisError::ConfigError, "nyquist must be positive");
        }
        if (request.sampleRate && !isPositiveFinite(*request.sampleRate)) {
            return RateResult::failure(SynthesisError::ConfigError,
                "sampling_rate must be positive");
        }

        RateInfo info;
        if (request.nyquist && request.sampleRate) {
            if (*request.nyquist != *request.sampleRate / 2.0) {
                return RateResult::failure(SynthesisError::ConfigError,
                    "nyquist must equal sampling_rate/2 (nyquist "
                    + std::to_string(*request.nyquist) + " Hz, sampling_rate "
                    + std::to_string(*request.sampleRate) + " Hz)");
            }
            info.nyquist = *request.nyquist;
            info.sampleRate = *request.sampleRate;
        } else if (request.nyquist) {
            info.nyquist = *request.nyquist;
            info.sampleRate = 2.0 * info.nyquist;
        } else {
            info.sampleRate = *request.sampleRate;
            info.nyquist = info.sampleRate / 2.0;
        }

        if (!isPositiveFinite(request.duration)) {
            return RateResult::failure(SynthesisError::ConfigError, "duration must be positive");
        }

        const double roundedRate = std::round(info.sampleRate);
        if (!isWholeNumber(info.sampleRate) || roundedRate > static_cast<double>(kMaxSampleRate)) {
            return RateResult::failure(SynthesisError::ConfigError,
                "sampling_rate must be a whole number of Hz no larger than "
                + std::to_string(kMaxSampleRate) + " (got "
                + std::to_string(info.sampleRate) + ")");
        }

        const double intervals = request.duration * info.nyquist;
        if (!isWholeNumber(intervals) || std::round(intervals) < 1.0) {
            return RateResult::failure(SynthesisError::ConfigError,
                "duration * nyquist must be a whole number of at least 1 (got "
                + std::to_string(intervals) + ")");
        }

        for (double f : request.frequencies) {
            if (f > info.nyquist) {
                return RateResult::failure(SynthesisError::DomainError,
                    "freqs may not contain values greater than nyquist ("
                    + std::to_string(f) + " Hz > " + std::to_string(info.nyquist) + " Hz)");
            }
        }

        info.numBins = static_cast<size_t>(std::round(intervals)) + 1;
        info.numSamples = SignalReconstructor::outputLength(info.numBins);
        return RateResult::success(info);
    }

    /// @brief Build the extended, sorted response curve for a request
    /// @param nyquist Resolved nyquist (see resolveRates())
    [[nodiscard]] static Result<ResponseCurve> buildResponseCurve(const NoiseRequest& request,
                                                                  double nyquist) {
        using CurveResult = Result<ResponseCurve>;

        if (!isValidBoundaryPolicy(request.lowerBoundary)) {
            return CurveResult::failure(SynthesisError::InvalidPolicy,
                invalidBoundaryPolicyMessage("lb_type"));
        }
        if (!isValidBoundaryPolicy(request.upperBoundary)) {
            return CurveResult::failure(SynthesisError::InvalidPolicy,
                invalidBoundaryPolicyMessage("ub_type"));
        }

        auto points = makeControlPoints(request.frequencies, request.responses);
        if (!points) return CurveResult::failure(points.status());

        const BoundaryExtender extender(BoundaryConfig{nyquist, request.lowerBoundary,
                                                       request.upperBoundary, request.epsilon});
        auto extended = extender.extend(points.value);
        if (!extended) return CurveResult::failure(extended.status());

        return ResponseCurve::fromPoints(std::move(extended.value));
    }

    // -------------------------------------------------------------------------
    // Synthesis
    // -------------------------------------------------------------------------

    /// @brief Synthesize the raw (unnormalized) signal
    /// @param rng Phase source; advanced by numBins draws on success
    [[nodiscard]] Result<SynthesizedSignal> synthesize(const NoiseRequest& request,
                                                       Xorshift32& rng) {
        using SignalResult = Result<SynthesizedSignal>;

        auto rates = resolveRates(request);
        if (!rates) return SignalResult::failure(rates.status());
        rates_ = rates.value;

        auto curve = buildResponseCurve(request, rates_.nyquist);
        if (!curve) return SignalResult::failure(curve.status());

        auto bins = sampler_.sample(curve.value, rates_.nyquist, rates_.numBins, rng);
        if (!bins) return SignalResult::failure(bins.status());

        auto samples = reconstructor_.reconstruct(bins.value);
        if (!samples) return SignalResult::failure(samples.status());

        if (samples.value.size() != rates_.numSamples) {
            return SignalResult::failure(SynthesisError::FftError,
                "reconstructed " + std::to_string(samples.value.size())
                + " samples, expected " + std::to_string(rates_.numSamples));
        }

        SynthesizedSignal signal;
        signal.samples = std::move(samples.value);
        signal.sampleRate = rates_.sampleRate;
        return SignalResult::success(std::move(signal));
    }

    /// @brief Synthesize and normalize to request.peakLevel
    /// @return SilentSignal if the response is zero on every sampled bin
    [[nodiscard]] Result<SynthesizedSignal> render(const NoiseRequest& request,
                                                   Xorshift32& rng) {
        using SignalResult = Result<SynthesizedSignal>;

        if (!(request.peakLevel > 0.0f) || !std::isfinite(request.peakLevel)) {
            return SignalResult::failure(SynthesisError::ConfigError,
                "peak level must be positive");
        }

        auto signal = synthesize(request, rng);
        if (!signal) return signal;

        const Status normalized = normalizePeak(signal.value.samples, request.peakLevel);
        if (!normalized) return SignalResult::failure(normalized);
        return signal;
    }

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    /// Rates resolved by the most recent synthesize() call
    [[nodiscard]] const RateInfo& rates() const noexcept { return rates_; }

    /// Magnitudes sampled by the most recent synthesize() call
    [[nodiscard]] const std::vector<float>& sampledMagnitudes() const noexcept {
        return sampler_.magnitudes();
    }

    /// Largest imaginary part discarded by the most recent synthesize() call
    [[nodiscard]] float imaginaryResidue() const noexcept {
        return reconstructor_.imaginaryResidue();
    }

private:
    [[nodiscard]] static bool isPositiveFinite(double value) noexcept {
        return value > 0.0 && std::isfinite(value);
    }

    [[nodiscard]] static bool isWholeNumber(double value) noexcept {
        return std::abs(value - std::round(value))
            <= kWholeNumberTolerance * std::max(1.0, std::abs(value));
    }

    SpectralSampler sampler_;
    SignalReconstructor reconstructor_;
    RateInfo rates_;
};

} // namespace DSP
} // namespace Shapenoise
