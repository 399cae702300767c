// ==============================================================================
// Reference Noise Generator
// ==============================================================================
// Writes the reference shaped-noise signals used for equipment testing:
// flat, band-limited, triangular, decreasing and impulse-like spectra.
// All signals use nyquist = 8000 Hz (16 kHz sampling) and the default 10 s
// duration.
//
// Usage:
//   shapenoise_examples [output_dir] [--seed <n>]
//   shapenoise_examples [output_dir] --freqs <f,...> --responses <r,...>
//                       [--lb zero|flat|linear] [--ub zero|flat|linear]
//                       [--nyquist <hz> | --sampling-rate <hz>]
//                       [--duration <s>] [--out <file>] [--seed <n>]
//
// output_dir defaults to "Examples". Without --freqs/--responses the eight
// reference signals are written; with them a single custom signal is written
// to --out (default "shaped_noise.wav") inside output_dir. Without --seed the
// phase generator is seeded from std::random_device, so every run produces
// new noise.
// ==============================================================================

#include <shapenoise/dsp/core/boundary_policy.h>
#include <shapenoise/dsp/core/random.h>
#include <shapenoise/dsp/core/synthesis_error.h>
#include <shapenoise/dsp/io/noise_file.h>
#include <shapenoise/dsp/io/request_options.h>
#include <shapenoise/dsp/systems/spectral_noise_synthesizer.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <random>
#include <string>
#include <string_view>
#include <vector>

using namespace Shapenoise::DSP;

namespace {

// ==============================================================================
// Reference Definitions
// ==============================================================================

struct ReferenceNoise {
    const char* filename;
    const char* description;
    std::vector<double> frequencies;
    std::vector<double> responses;
    BoundaryPolicy lower = BoundaryPolicy::Linear;
    BoundaryPolicy upper = BoundaryPolicy::Linear;
};

constexpr double kReferenceNyquist = 8000.0;

std::vector<ReferenceNoise> createReferenceSet() {
    using BP = BoundaryPolicy;
    return {
        {"uniform_0Hz-8000Hz.wav",
         "flat response across the whole 0-8000 Hz spectrum",
         {4000.0}, {1.0}, BP::Flat, BP::Flat},
        {"uniform_2000Hz-6000Hz_zero_boundary.wav",
         "flat 2000-6000 Hz, zero elsewhere",
         {2000.0, 6000.0}, {1.0, 1.0}, BP::Zero, BP::Zero},
        {"uniform_2000Hz-6000Hz_linear_boundary.wav",
         "flat 2000-6000 Hz, ramping linearly to zero outside",
         {2000.0, 6000.0}, {1.0, 1.0}, BP::Linear, BP::Linear},
        {"triangular_0Hz-8000Hz.wav",
         "triangle across 0-8000 Hz peaking at 4000 Hz",
         {4000.0}, {1.0}, BP::Linear, BP::Linear},
        {"triangular_2000Hz-6000Hz_zero_boundary.wav",
         "triangle across 2000-6000 Hz peaking at 4000 Hz, zero elsewhere",
         {2000.0, 4000.0, 6000.0}, {0.0, 1.0, 0.0}, BP::Linear, BP::Linear},
        {"decreasing_0Hz-8000Hz.wav",
         "linearly decreasing from 0 Hz to 8000 Hz",
         {0.0}, {1.0}, BP::Linear, BP::Linear},
        {"decreasing_2000Hz-8000Hz_zero_boundary.wav",
         "linearly decreasing from 2000 Hz to 8000 Hz, zero below",
         {2000.0}, {1.0}, BP::Zero, BP::Linear},
        {"impulse_4000Hz.wav",
         "single spectral line at 4000 Hz",
         {4000.0}, {1.0}, BP::Zero, BP::Zero},
    };
}

// ==============================================================================
// Argument Parsing
// ==============================================================================

struct Options {
    std::filesystem::path outputDir = "Examples";
    bool haveSeed = false;
    uint32_t seed = 0;

    bool custom = false;                      ///< --freqs or --responses given
    NoiseRequestOptions request;
    std::filesystem::path customFile = "shaped_noise.wav";
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [output_dir] [--seed <n>]\n"
              << "       " << program << " [output_dir] --freqs <f,...> --responses <r,...>\n"
              << "           [--lb zero|flat|linear] [--ub zero|flat|linear]\n"
              << "           [--nyquist <hz> | --sampling-rate <hz>] [--duration <s>]\n"
              << "           [--out <file>] [--seed <n>]" << std::endl;
}

/// Options that take one value and store it as text
std::string* textOption(std::string_view arg, Options& options) {
    if (arg == "--freqs") return &options.request.frequencies;
    if (arg == "--responses") return &options.request.responses;
    if (arg == "--lb") return &options.request.lowerBoundary;
    if (arg == "--ub") return &options.request.upperBoundary;
    if (arg == "--nyquist") return &options.request.nyquist;
    if (arg == "--sampling-rate") return &options.request.sampleRate;
    if (arg == "--duration") return &options.request.duration;
    return nullptr;
}

bool parseArguments(int argc, char* argv[], Options& options) {
    bool haveDir = false;
    bool haveOut = false;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (std::string* field = textOption(arg, options)) {
            if (i + 1 >= argc) {
                std::cerr << arg << " requires a value" << std::endl;
                return false;
            }
            *field = argv[++i];
            if (arg == "--freqs" || arg == "--responses") options.custom = true;
        } else if (arg == "--out") {
            if (i + 1 >= argc) {
                std::cerr << "--out requires a value" << std::endl;
                return false;
            }
            options.customFile = argv[++i];
            haveOut = true;
        } else if (arg == "--seed") {
            if (i + 1 >= argc) {
                std::cerr << "--seed requires a value" << std::endl;
                return false;
            }
            char* end = nullptr;
            const unsigned long value = std::strtoul(argv[++i], &end, 10);
            if (end == argv[i] || *end != '\0') {
                std::cerr << "Invalid seed: " << argv[i] << std::endl;
                return false;
            }
            options.seed = static_cast<uint32_t>(value);
            options.haveSeed = true;
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            std::exit(EXIT_SUCCESS);
        } else if (!haveDir) {
            options.outputDir = argv[i];
            haveDir = true;
        } else {
            std::cerr << "Unexpected argument: " << arg << std::endl;
            return false;
        }
    }
    if (haveOut && !options.custom) {
        std::cerr << "--out requires --freqs and --responses" << std::endl;
        return false;
    }
    return true;
}

/// Write the single signal described by --freqs/--responses and friends
int generateCustom(const Options& options, Xorshift32& rng) {
    auto request = parseNoiseRequestOptions(options.request);
    if (!request) {
        std::cerr << errorName(request.error) << ": " << request.errorMessage << std::endl;
        return EXIT_FAILURE;
    }

    const auto path = options.outputDir / options.customFile;
    const auto result = generateShapedNoise(path, request.value, rng);
    if (!result) {
        std::cerr << "  Failed: " << path.string() << ": "
                  << errorName(result.error) << ": " << result.errorMessage << std::endl;
        return EXIT_FAILURE;
    }

    std::cout << "  Created: " << path.string() << " (" << result.rates.numSamples
              << " samples @ " << result.rates.sampleRate << " Hz)" << std::endl;
    return EXIT_SUCCESS;
}

} // namespace

// ==============================================================================
// Main
// ==============================================================================

int main(int argc, char* argv[]) {
    Options options;
    if (!parseArguments(argc, argv, options)) {
        return EXIT_FAILURE;
    }

    const uint32_t seed = options.haveSeed ? options.seed : std::random_device{}();
    Xorshift32 rng(seed);

    if (options.custom) {
        return generateCustom(options, rng);
    }

    SpectralNoiseSynthesizer synthesizer;

    const auto references = createReferenceSet();
    int successCount = 0;

    std::cout << "Generating " << references.size() << " reference signals into "
              << options.outputDir << " (seed " << seed << ")..." << std::endl;

    for (const auto& reference : references) {
        NoiseRequest request;
        request.frequencies = reference.frequencies;
        request.responses = reference.responses;
        request.nyquist = kReferenceNyquist;
        request.lowerBoundary = reference.lower;
        request.upperBoundary = reference.upper;

        const auto path = options.outputDir / reference.filename;
        const auto result = generateShapedNoise(path, request, rng, synthesizer);

        if (result) {
            std::cout << "  Created: " << reference.filename << " - " << reference.description
                      << " (" << result.rates.numSamples << " samples @ "
                      << result.rates.sampleRate << " Hz)" << std::endl;
            ++successCount;
        } else {
            std::cerr << "  Failed: " << reference.filename << ": "
                      << errorName(result.error) << ": " << result.errorMessage << std::endl;
        }
    }

    std::cout << "Done: " << successCount << "/" << references.size()
              << " signals written." << std::endl;

    return successCount == static_cast<int>(references.size()) ? EXIT_SUCCESS : EXIT_FAILURE;
}
