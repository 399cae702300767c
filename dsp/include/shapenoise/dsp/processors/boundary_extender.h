// ==============================================================================
// Layer 2: DSP Processor - Boundary Extender
// ==============================================================================
// Extends sparse control points so they reach from 0 Hz to nyquist, adding
// synthetic points on each side according to a BoundaryPolicy:
//
//   Flat    (0, r_min)                      (nyquist, r_max)
//   Linear  (0, 0)                          (nyquist, 0)
//   Zero    (f_min - eps, 0), (0, 0)        (f_max + eps, 0), (nyquist, 0)
//
// Synthetic points are appended after the caller's points; ordering is left
// to ResponseCurve.
// ==============================================================================

#pragma once

#include <shapenoise/dsp/core/boundary_policy.h>
#include <shapenoise/dsp/core/control_point.h>
#include <shapenoise/dsp/core/synthesis_error.h>

#include <cmath>
#include <cstddef>
#include <string>

namespace Shapenoise {
namespace DSP {

/// Default distance past an extreme control point at which a Zero boundary
/// reaches zero response (Hz)
inline constexpr double kDefaultBoundaryEpsilon = 0.001;

/// @brief Parameters for boundary extension
struct BoundaryConfig {
    double nyquist = 0.0;                                 ///< Upper spectrum limit (Hz)
    BoundaryPolicy lower = kDefaultBoundaryPolicy;        ///< Policy below the lowest point
    BoundaryPolicy upper = kDefaultBoundaryPolicy;        ///< Policy above the highest point
    double epsilon = kDefaultBoundaryEpsilon;             ///< Zero-policy cutoff distance (Hz)
};

/// @brief Layer 2 DSP Processor - extends control points to [0, nyquist]
///
/// When an extreme control point already sits on its limit (f_min == 0 or
/// f_max == nyquist) nothing is added on that side.
///
/// A Zero cutoff that would land on or beyond its limit (f_min - eps <= 0, or
/// f_max + eps >= nyquist) collapses onto the limit point alone, so the
/// extension never produces a duplicate or negative frequency.
class BoundaryExtender {
public:
    BoundaryExtender() = default;
    explicit BoundaryExtender(const BoundaryConfig& config) : config_(config) {}

    void setConfig(const BoundaryConfig& config) noexcept { config_ = config; }
    [[nodiscard]] const BoundaryConfig& config() const noexcept { return config_; }

    /// @brief Extend points to cover [0, nyquist]
    /// @return ConfigError for a non-positive nyquist or epsilon, DomainError
    ///         for a negative frequency or one above nyquist, InvalidPolicy for
    ///         an unknown policy
    [[nodiscard]] Result<ControlPoints> extend(const ControlPoints& points) const {
        if (!(config_.nyquist > 0.0) || !std::isfinite(config_.nyquist)) {
            return Result<ControlPoints>::failure(SynthesisError::ConfigError,
                "nyquist must be positive");
        }
        if (!(config_.epsilon > 0.0) || !std::isfinite(config_.epsilon)) {
            return Result<ControlPoints>::failure(SynthesisError::ConfigError,
                "eps must be positive");
        }
        if (points.empty()) {
            return Result<ControlPoints>::failure(SynthesisError::ConfigError,
                "at least one control point is required");
        }

        ControlPoints extended = points;

        // Low side
        const size_t minIndex = indexOfMinFrequency(extended);
        const ControlPoint lowest = extended[minIndex];
        if (lowest.frequency < 0.0) {
            return Result<ControlPoints>::failure(SynthesisError::DomainError,
                "frequencies must be nonnegative (got "
                + std::to_string(lowest.frequency) + " Hz)");
        }
        if (lowest.frequency > 0.0) {
            switch (config_.lower) {
                case BoundaryPolicy::Flat:
                    extended.push_back({0.0, lowest.response});
                    break;
                case BoundaryPolicy::Linear:
                    extended.push_back({0.0, 0.0});
                    break;
                case BoundaryPolicy::Zero:
                    if (lowest.frequency - config_.epsilon > 0.0) {
                        extended.push_back({lowest.frequency - config_.epsilon, 0.0});
                    }
                    extended.push_back({0.0, 0.0});
                    break;
                default:
                    return invalidPolicy("lb_type", config_.lower);
            }
        }

        // High side
        const size_t maxIndex = indexOfMaxFrequency(extended);
        const ControlPoint highest = extended[maxIndex];
        if (highest.frequency > config_.nyquist) {
            return Result<ControlPoints>::failure(SynthesisError::DomainError,
                "frequencies cannot be greater than nyquist ("
                + std::to_string(highest.frequency) + " Hz > "
                + std::to_string(config_.nyquist) + " Hz)");
        }
        if (highest.frequency < config_.nyquist) {
            switch (config_.upper) {
                case BoundaryPolicy::Flat:
                    extended.push_back({config_.nyquist, highest.response});
                    break;
                case BoundaryPolicy::Linear:
                    extended.push_back({config_.nyquist, 0.0});
                    break;
                case BoundaryPolicy::Zero:
                    if (highest.frequency + config_.epsilon < config_.nyquist) {
                        extended.push_back({highest.frequency + config_.epsilon, 0.0});
                    }
                    extended.push_back({config_.nyquist, 0.0});
                    break;
                default:
                    return invalidPolicy("ub_type", config_.upper);
            }
        }

        return Result<ControlPoints>::success(std::move(extended));
    }

private:
    // First occurrence wins on ties, so Flat copies the earliest listed point.
    [[nodiscard]] static size_t indexOfMinFrequency(const ControlPoints& points) noexcept {
        size_t index = 0;
        for (size_t i = 1; i < points.size(); ++i) {
            if (points[i].frequency < points[index].frequency) index = i;
        }
        return index;
    }

    [[nodiscard]] static size_t indexOfMaxFrequency(const ControlPoints& points) noexcept {
        size_t index = 0;
        for (size_t i = 1; i < points.size(); ++i) {
            if (points[i].frequency > points[index].frequency) index = i;
        }
        return index;
    }

    [[nodiscard]] static Result<ControlPoints> invalidPolicy(const char* side,
                                                             BoundaryPolicy policy) {
        return Result<ControlPoints>::failure(SynthesisError::InvalidPolicy,
            std::string(side) + " must be one of: 'zero', 'flat', 'linear' (got value "
            + std::to_string(static_cast<int>(policy)) + ")");
    }

    BoundaryConfig config_;
};

} // namespace DSP
} // namespace Shapenoise
