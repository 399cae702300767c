// ==============================================================================
// I/O - Shaped Noise Files
// ==============================================================================
// Top-level entry point: validate a NoiseRequest, synthesize the signal,
// normalize it to the requested peak and write it as a float WAV file.
// Nothing is written unless every earlier stage succeeds.
// ==============================================================================

#pragma once

#include <shapenoise/dsp/core/random.h>
#include <shapenoise/dsp/core/synthesis_error.h>
#include <shapenoise/dsp/io/wav_writer.h>
#include <shapenoise/dsp/systems/spectral_noise_synthesizer.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <string>

namespace Shapenoise {
namespace DSP {

/// @brief Outcome of generateShapedNoise()
struct GenerateResult {
    SynthesisError error = SynthesisError::Success;
    std::string errorMessage;   ///< Human-readable error description
    RateInfo rates;             ///< Resolved rates (valid on success)
    float peak = 0.0f;          ///< Largest |sample| written

    [[nodiscard]] bool ok() const noexcept { return error == SynthesisError::Success; }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }
};

/// @brief Synthesize shaped noise for request and write it to path
///
/// @param path Output WAV path (parent directories are created)
/// @param request Control points, rates and boundary policies
/// @param rng Phase source
/// @param synthesizer Synthesizer instance to reuse plans across calls
inline GenerateResult generateShapedNoise(const std::filesystem::path& path,
                                          const NoiseRequest& request,
                                          Xorshift32& rng,
                                          SpectralNoiseSynthesizer& synthesizer) {
    GenerateResult result;

    auto signal = synthesizer.render(request, rng);
    if (!signal) {
        result.error = signal.error;
        result.errorMessage = signal.errorMessage;
        return result;
    }
    result.rates = synthesizer.rates();

    const auto sampleRate = static_cast<uint32_t>(std::llround(signal.value.sampleRate));
    const Status written = writeWavFloat32Mono(path, sampleRate, signal.value.samples);
    if (!written) {
        result.error = written.error;
        result.errorMessage = written.errorMessage;
        return result;
    }

    for (float s : signal.value.samples) {
        result.peak = std::max(result.peak, std::abs(s));
    }
    return result;
}

/// @brief Convenience overload with a one-shot synthesizer
inline GenerateResult generateShapedNoise(const std::filesystem::path& path,
                                          const NoiseRequest& request,
                                          Xorshift32& rng) {
    SpectralNoiseSynthesizer synthesizer;
    return generateShapedNoise(path, request, rng, synthesizer);
}

} // namespace DSP
} // namespace Shapenoise
