// ==============================================================================
// I/O - Noise Request Options
// ==============================================================================
// Turns textual options (as given on a command line) into a NoiseRequest.
// Lists are comma-separated decimal numbers, e.g. "2000,4000,6000". Boundary
// policies are parsed by name with parseBoundaryPolicy().
//
// Only the syntax is checked here. Rate consistency, domain and policy use are
// validated by SpectralNoiseSynthesizer when the request is rendered.
// ==============================================================================

#pragma once

#include <shapenoise/dsp/core/boundary_policy.h>
#include <shapenoise/dsp/core/synthesis_error.h>
#include <shapenoise/dsp/systems/spectral_noise_synthesizer.h>

#include <cerrno>
#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Shapenoise {
namespace DSP {

/// @brief Unparsed request fields; empty strings leave NoiseRequest defaults
struct NoiseRequestOptions {
    std::string frequencies;                  ///< "--freqs"
    std::string responses;                    ///< "--responses"
    std::string lowerBoundary = "linear";     ///< "--lb"
    std::string upperBoundary = "linear";     ///< "--ub"
    std::string nyquist;                      ///< "--nyquist"
    std::string sampleRate;                   ///< "--sampling-rate"
    std::string duration;                     ///< "--duration"
};

namespace detail {

inline std::string_view trimSpaces(std::string_view text) noexcept {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) text.remove_suffix(1);
    return text;
}

} // namespace detail

/// @brief Parse one decimal number
/// @param field Option name used in the error message
/// @return ConfigError if text is empty, has trailing characters or overflows
[[nodiscard]] inline Result<double> parseNumber(std::string_view text, std::string_view field) {
    const std::string token(detail::trimSpaces(text));
    if (token.empty()) {
        return Result<double>::failure(SynthesisError::ConfigError,
            std::string(field) + " expects a number, got an empty value");
    }

    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(token.c_str(), &end);
    if (end != token.c_str() + token.size() || errno == ERANGE) {
        return Result<double>::failure(SynthesisError::ConfigError,
            std::string(field) + " expects a number, got '" + token + "'");
    }
    return Result<double>::success(value);
}

/// @brief Parse a comma-separated list of numbers
/// @return ConfigError for an empty list or any malformed entry
[[nodiscard]] inline Result<std::vector<double>> parseNumberList(std::string_view text,
                                                                 std::string_view field) {
    using ListResult = Result<std::vector<double>>;

    std::vector<double> values;
    size_t start = 0;
    while (start <= text.size()) {
        const size_t comma = text.find(',', start);
        const size_t stop = (comma == std::string_view::npos) ? text.size() : comma;

        auto value = parseNumber(text.substr(start, stop - start), field);
        if (!value) return ListResult::failure(value.status());
        values.push_back(value.value);

        if (comma == std::string_view::npos) break;
        start = comma + 1;
    }
    return ListResult::success(std::move(values));
}

/// @brief Build a NoiseRequest from textual options
///
/// @return ConfigError for malformed numbers or missing lists,
///         InvalidPolicy for an unknown --lb/--ub name
[[nodiscard]] inline Result<NoiseRequest> parseNoiseRequestOptions(const NoiseRequestOptions& options) {
    using RequestResult = Result<NoiseRequest>;

    NoiseRequest request;

    auto lower = parseBoundaryPolicy(options.lowerBoundary, "lb_type");
    if (!lower) return RequestResult::failure(lower.status());
    auto upper = parseBoundaryPolicy(options.upperBoundary, "ub_type");
    if (!upper) return RequestResult::failure(upper.status());
    request.lowerBoundary = lower.value;
    request.upperBoundary = upper.value;

    auto frequencies = parseNumberList(options.frequencies, "freqs");
    if (!frequencies) return RequestResult::failure(frequencies.status());
    auto responses = parseNumberList(options.responses, "responses");
    if (!responses) return RequestResult::failure(responses.status());
    request.frequencies = std::move(frequencies.value);
    request.responses = std::move(responses.value);

    if (!options.nyquist.empty()) {
        auto nyquist = parseNumber(options.nyquist, "nyquist");
        if (!nyquist) return RequestResult::failure(nyquist.status());
        request.nyquist = nyquist.value;
    }
    if (!options.sampleRate.empty()) {
        auto rate = parseNumber(options.sampleRate, "sampling_rate");
        if (!rate) return RequestResult::failure(rate.status());
        request.sampleRate = rate.value;
    }
    if (!options.duration.empty()) {
        auto duration = parseNumber(options.duration, "duration");
        if (!duration) return RequestResult::failure(duration.status());
        request.duration = duration.value;
    }

    return RequestResult::success(std::move(request));
}

} // namespace DSP
} // namespace Shapenoise
