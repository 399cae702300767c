// ==============================================================================
// I/O - IEEE Float WAV Files
// ==============================================================================
// Mono 32-bit float RIFF/WAVE writer and reader.
//
// Layout written:
//   "RIFF" size "WAVE"
//   "fmt " 18  tag=3 (IEEE float), channels=1, rate, byteRate, align=4, bits=32, cbSize=0
//   "fact" 4   frame count
//   "data" size  little-endian float32 samples
// ==============================================================================

#pragma once

#include <shapenoise/dsp/core/synthesis_error.h>

#include <cstdint>
#include <filesystem>
#include <vector>

namespace Shapenoise {
namespace DSP {

/// WAVE format tag for IEEE float samples
inline constexpr uint16_t kWavFormatIeeeFloat = 3;

/// WAVE format tag for integer PCM samples
inline constexpr uint16_t kWavFormatPcm = 1;

/// Highest mono float32 rate whose byte rate (rate * 4) fits the 32-bit
/// fmt field
inline constexpr uint32_t kMaxWavSampleRate = UINT32_MAX / 4;

/// @brief Samples and rate read back from a WAV file
struct WavData {
    std::vector<float> samples;
    uint32_t sampleRate = 0;
    uint16_t channels = 0;
};

/// @brief Write mono float32 samples as an IEEE-float WAV file
///
/// Missing parent directories are created.
///
/// @return WriteError if the path is empty, the rate is 0 or above
///         kMaxWavSampleRate, the data would not fit a RIFF chunk, or the
///         file cannot be created or written
[[nodiscard]] Status writeWavFloat32Mono(const std::filesystem::path& path,
                                         uint32_t sampleRate,
                                         const std::vector<float>& samples);

/// @brief Read a mono IEEE-float WAV file written by writeWavFloat32Mono()
///
/// Unknown chunks are skipped. A data chunk whose declared size runs past
/// the end of the file is read up to the last whole sample present.
///
/// @return ReadError if the file is missing, truncated, or not mono
///         32-bit IEEE float
[[nodiscard]] Result<WavData> readWavFloat32Mono(const std::filesystem::path& path);

} // namespace DSP
} // namespace Shapenoise
