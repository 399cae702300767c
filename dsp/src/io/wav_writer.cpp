// ==============================================================================
// I/O - IEEE Float WAV Files
// ==============================================================================

#include "shapenoise/dsp/io/wav_writer.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstring>
#include <fstream>
#include <limits>
#include <string>
#include <system_error>
#include <utility>

namespace Shapenoise {
namespace DSP {

namespace {

constexpr uint32_t kFmtChunkSize = 18;   // 16 + cbSize
constexpr uint32_t kFactChunkSize = 4;
constexpr uint16_t kBitsPerSample = 32;
constexpr uint16_t kBytesPerSample = kBitsPerSample / 8;

void writeLE16(std::ofstream& f, uint16_t v) {
    char b[2];
    b[0] = static_cast<char>(v & 0xFF);
    b[1] = static_cast<char>((v >> 8) & 0xFF);
    f.write(b, 2);
}

void writeLE32(std::ofstream& f, uint32_t v) {
    char b[4];
    b[0] = static_cast<char>(v & 0xFF);
    b[1] = static_cast<char>((v >> 8) & 0xFF);
    b[2] = static_cast<char>((v >> 16) & 0xFF);
    b[3] = static_cast<char>((v >> 24) & 0xFF);
    f.write(b, 4);
}

uint16_t readLE16(const unsigned char* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t readLE32(const unsigned char* p) {
    return static_cast<uint32_t>(p[0])
        | (static_cast<uint32_t>(p[1]) << 8)
        | (static_cast<uint32_t>(p[2]) << 16)
        | (static_cast<uint32_t>(p[3]) << 24);
}

bool readExact(std::ifstream& f, unsigned char* dst, std::streamsize n) {
    f.read(reinterpret_cast<char*>(dst), n);
    return f.gcount() == n;
}

/// Bytes between the read position and the end of the file
uint64_t bytesRemaining(std::ifstream& f, uint64_t fileSize) {
    const std::streamoff pos = f.tellg();
    if (pos < 0 || static_cast<uint64_t>(pos) >= fileSize) return 0;
    return fileSize - static_cast<uint64_t>(pos);
}

} // namespace

Status writeWavFloat32Mono(const std::filesystem::path& path,
                           uint32_t sampleRate,
                           const std::vector<float>& samples) {
    if (path.empty()) {
        return Status::failure(SynthesisError::WriteError, "output path is empty");
    }
    if (sampleRate == 0) {
        return Status::failure(SynthesisError::WriteError, "invalid sample rate 0");
    }

    const uint64_t dataBytes = static_cast<uint64_t>(samples.size()) * kBytesPerSample;
    const uint64_t riffBytes = 4 + (8 + kFmtChunkSize) + (8 + kFactChunkSize) + (8 + dataBytes);
    if (riffBytes > std::numeric_limits<uint32_t>::max()) {
        return Status::failure(SynthesisError::WriteError,
            "signal too long for a WAV file (" + std::to_string(samples.size()) + " samples)");
    }

    // The fmt chunk stores sampleRate * blockAlign in 32 bits
    if (sampleRate > kMaxWavSampleRate) {
        return Status::failure(SynthesisError::WriteError,
            "sample rate " + std::to_string(sampleRate)
            + " Hz overflows the WAV byte-rate field (max " + std::to_string(kMaxWavSampleRate) + ")");
    }

    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Status::failure(SynthesisError::WriteError,
                "could not create directory " + path.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream f(path, std::ios::binary);
    if (!f) {
        return Status::failure(SynthesisError::WriteError,
            "could not open output file " + path.string());
    }

    const uint16_t channels = 1;
    const uint16_t blockAlign = static_cast<uint16_t>(channels * kBytesPerSample);
    const uint64_t byteRate = static_cast<uint64_t>(sampleRate) * blockAlign;

    // RIFF header
    f.write("RIFF", 4);
    writeLE32(f, static_cast<uint32_t>(riffBytes));
    f.write("WAVE", 4);

    // fmt chunk
    f.write("fmt ", 4);
    writeLE32(f, kFmtChunkSize);
    writeLE16(f, kWavFormatIeeeFloat);
    writeLE16(f, channels);
    writeLE32(f, sampleRate);
    writeLE32(f, static_cast<uint32_t>(byteRate));
    writeLE16(f, blockAlign);
    writeLE16(f, kBitsPerSample);
    writeLE16(f, 0);  // cbSize

    // fact chunk (required for non-PCM formats)
    f.write("fact", 4);
    writeLE32(f, kFactChunkSize);
    writeLE32(f, static_cast<uint32_t>(samples.size()));

    // data chunk
    f.write("data", 4);
    writeLE32(f, static_cast<uint32_t>(dataBytes));
    for (float sample : samples) {
        uint32_t bits = 0;
        std::memcpy(&bits, &sample, sizeof(bits));
        writeLE32(f, bits);
    }

    f.flush();
    if (!f) {
        return Status::failure(SynthesisError::WriteError,
            "failed while writing " + path.string());
    }
    return Status::success();
}

Result<WavData> readWavFloat32Mono(const std::filesystem::path& path) {
    using WavResult = Result<WavData>;

    std::ifstream f(path, std::ios::binary | std::ios::ate);
    if (!f) {
        return WavResult::failure(SynthesisError::ReadError, "could not open " + path.string());
    }
    const std::streamoff end = f.tellg();
    f.seekg(0, std::ios::beg);
    if (end < 0 || !f) {
        return WavResult::failure(SynthesisError::ReadError, "could not size " + path.string());
    }
    const auto fileSize = static_cast<uint64_t>(end);

    std::array<unsigned char, 12> header{};
    if (!readExact(f, header.data(), 12)
        || std::memcmp(header.data(), "RIFF", 4) != 0
        || std::memcmp(header.data() + 8, "WAVE", 4) != 0) {
        return WavResult::failure(SynthesisError::ReadError,
            path.string() + " is not a RIFF/WAVE file");
    }

    WavData wav;
    bool haveFormat = false;
    std::array<unsigned char, 8> chunk{};

    while (readExact(f, chunk.data(), 8)) {
        const uint32_t chunkSize = readLE32(chunk.data() + 4);
        const uint64_t remaining = bytesRemaining(f, fileSize);

        if (std::memcmp(chunk.data(), "fmt ", 4) == 0) {
            if (chunkSize < 16) {
                return WavResult::failure(SynthesisError::ReadError, "fmt chunk too short");
            }
            if (chunkSize > remaining) {
                return WavResult::failure(SynthesisError::ReadError, "truncated fmt chunk");
            }
            std::vector<unsigned char> fmt(chunkSize);
            if (!readExact(f, fmt.data(), chunkSize)) {
                return WavResult::failure(SynthesisError::ReadError, "truncated fmt chunk");
            }
            const uint16_t format = readLE16(fmt.data());
            wav.channels = readLE16(fmt.data() + 2);
            wav.sampleRate = readLE32(fmt.data() + 4);
            const uint16_t bits = readLE16(fmt.data() + 14);
            if (format != kWavFormatIeeeFloat || bits != kBitsPerSample || wav.channels != 1) {
                return WavResult::failure(SynthesisError::ReadError,
                    path.string() + " is not mono 32-bit IEEE float (format "
                    + std::to_string(format) + ", " + std::to_string(wav.channels)
                    + " channels, " + std::to_string(bits) + " bits)");
            }
            haveFormat = true;
        } else if (std::memcmp(chunk.data(), "data", 4) == 0) {
            if (!haveFormat) {
                return WavResult::failure(SynthesisError::ReadError, "data chunk before fmt chunk");
            }
            // Writers that stream audio leave a placeholder size in the
            // header; never allocate past what the file actually holds.
            const uint64_t available = std::min<uint64_t>(chunkSize, remaining);
            const uint64_t payloadBytes = available - (available % kBytesPerSample);
            std::vector<unsigned char> payload(static_cast<size_t>(payloadBytes));
            if (!readExact(f, payload.data(), static_cast<std::streamsize>(payloadBytes))) {
                return WavResult::failure(SynthesisError::ReadError, "truncated data chunk");
            }
            wav.samples.resize(static_cast<size_t>(payloadBytes / kBytesPerSample));
            for (size_t i = 0; i < wav.samples.size(); ++i) {
                const uint32_t bits = readLE32(payload.data() + i * kBytesPerSample);
                std::memcpy(&wav.samples[i], &bits, sizeof(bits));
            }
            return WavResult::success(std::move(wav));
        } else {
            if (chunkSize >= remaining) break;
            f.seekg(static_cast<std::streamoff>(chunkSize), std::ios::cur);
            if (!f) break;
        }

        // Chunks are padded to an even size
        if (chunkSize & 1u) f.seekg(1, std::ios::cur);
    }

    return WavResult::failure(SynthesisError::ReadError, path.string() + " has no data chunk");
}

} // namespace DSP
} // namespace Shapenoise
