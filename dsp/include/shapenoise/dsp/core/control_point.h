// ==============================================================================
// Layer 0: Core Utility - Control Points
// ==============================================================================
// (frequency, response) pairs describing a sparse magnitude response.
// ==============================================================================

#pragma once

#include <shapenoise/dsp/core/synthesis_error.h>

#include <cmath>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace Shapenoise::DSP {

/// One point of a piecewise-linear magnitude response
struct ControlPoint {
    double frequency = 0.0;  ///< Hz, >= 0
    double response = 0.0;   ///< Linear magnitude, >= 0
};

using ControlPoints = std::vector<ControlPoint>;

/// @brief Zip parallel frequency/response sequences into control points.
///
/// Order is preserved; nothing is sorted here.
///
/// @return ConfigError if the sequences are empty or differ in length,
///         DomainError if a value is not finite or a response is negative
[[nodiscard]] inline Result<ControlPoints> makeControlPoints(
    const std::vector<double>& frequencies,
    const std::vector<double>& responses) {
    if (frequencies.size() != responses.size()) {
        return Result<ControlPoints>::failure(SynthesisError::ConfigError,
            "frequencies and responses must have the same length ("
            + std::to_string(frequencies.size()) + " vs "
            + std::to_string(responses.size()) + ")");
    }
    if (frequencies.empty()) {
        return Result<ControlPoints>::failure(SynthesisError::ConfigError,
            "at least one control point is required");
    }

    ControlPoints points;
    points.reserve(frequencies.size());
    for (size_t i = 0; i < frequencies.size(); ++i) {
        if (!std::isfinite(frequencies[i]) || !std::isfinite(responses[i])) {
            return Result<ControlPoints>::failure(SynthesisError::DomainError,
                "control point " + std::to_string(i) + " is not finite");
        }
        if (responses[i] < 0.0) {
            return Result<ControlPoints>::failure(SynthesisError::DomainError,
                "responses must be nonnegative (got " + std::to_string(responses[i])
                + " at index " + std::to_string(i) + ")");
        }
        points.push_back({frequencies[i], responses[i]});
    }
    return Result<ControlPoints>::success(std::move(points));
}

} // namespace Shapenoise::DSP
