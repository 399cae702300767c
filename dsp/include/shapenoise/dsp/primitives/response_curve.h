// ==============================================================================
// Layer 1: DSP Primitive - Piecewise-Linear Response Curve
// ==============================================================================
// Continuous magnitude response built from control points by linear
// interpolation between neighbours in frequency order.
//
// The curve owns ordering: points may arrive in any order (the boundary
// extender appends its synthetic points at the end) and are sorted here.
// After sorting, frequencies must be strictly increasing.
// ==============================================================================

#pragma once

#include <shapenoise/dsp/core/control_point.h>
#include <shapenoise/dsp/core/interpolation.h>
#include <shapenoise/dsp/core/synthesis_error.h>

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace Shapenoise {
namespace DSP {

/// @brief Piecewise-linear magnitude response over [minFrequency, maxFrequency]
///
/// @par Usage
/// @code
/// auto curve = ResponseCurve::fromPoints({{0.0, 0.0}, {4000.0, 1.0}, {8000.0, 0.0}});
/// if (curve) {
///     auto y = curve.value.evaluate(2000.0);  // y.value == 0.5
/// }
/// @endcode
class ResponseCurve {
public:
    ResponseCurve() = default;

    /// @brief Sort points by frequency and build the curve.
    /// @return DomainError if fewer than two points remain or two points share
    ///         a frequency after sorting
    [[nodiscard]] static Result<ResponseCurve> fromPoints(ControlPoints points) {
        if (points.size() < 2) {
            return Result<ResponseCurve>::failure(SynthesisError::DomainError,
                "response curve needs at least two points, got "
                + std::to_string(points.size()));
        }

        std::stable_sort(points.begin(), points.end(),
            [](const ControlPoint& a, const ControlPoint& b) {
                return a.frequency < b.frequency;
            });

        for (size_t i = 1; i < points.size(); ++i) {
            if (!(points[i].frequency > points[i - 1].frequency)) {
                return Result<ResponseCurve>::failure(SynthesisError::DomainError,
                    "frequencies must be strictly increasing after sorting; "
                    + std::to_string(points[i].frequency)
                    + " Hz appears more than once");
            }
        }

        ResponseCurve curve;
        curve.points_ = std::move(points);
        return Result<ResponseCurve>::success(std::move(curve));
    }

    // -------------------------------------------------------------------------
    // Evaluation
    // -------------------------------------------------------------------------

    /// @brief Response at one frequency
    /// @return DomainError if frequency lies outside the curve's domain
    [[nodiscard]] Result<double> evaluate(double frequency) const {
        if (!covers(frequency)) {
            return Result<double>::failure(SynthesisError::DomainError,
                outOfDomainMessage(frequency));
        }
        const auto upper = std::lower_bound(points_.begin(), points_.end(), frequency,
            [](const ControlPoint& p, double f) { return p.frequency < f; });
        return Result<double>::success(interpolateSegment(
            static_cast<size_t>(upper - points_.begin()), frequency));
    }

    /// @brief Response on an ascending frequency grid, in one forward pass.
    /// @param frequencies Ascending query frequencies
    /// @param count Number of queries
    /// @param output Receives count magnitudes
    /// @return DomainError if any query lies outside the domain or the grid
    ///         is not ascending
    [[nodiscard]] Status evaluateAscending(const double* frequencies, size_t count,
                                           float* output) const {
        size_t segment = 1;
        double previous = minFrequency();
        for (size_t i = 0; i < count; ++i) {
            const double f = frequencies[i];
            if (!covers(f)) {
                return Status::failure(SynthesisError::DomainError, outOfDomainMessage(f));
            }
            if (f < previous) {
                return Status::failure(SynthesisError::DomainError,
                    "query frequencies must be ascending");
            }
            previous = f;

            while (segment < points_.size() - 1 && points_[segment].frequency < f) {
                ++segment;
            }
            output[i] = static_cast<float>(interpolateSegment(segment, f));
        }
        return Status::success();
    }

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    [[nodiscard]] bool covers(double frequency) const noexcept {
        return !points_.empty()
            && frequency >= points_.front().frequency
            && frequency <= points_.back().frequency;
    }

    [[nodiscard]] double minFrequency() const noexcept {
        return points_.empty() ? 0.0 : points_.front().frequency;
    }

    [[nodiscard]] double maxFrequency() const noexcept {
        return points_.empty() ? 0.0 : points_.back().frequency;
    }

    /// Sorted control points
    [[nodiscard]] const ControlPoints& points() const noexcept { return points_; }

private:
    /// @param upper Index of the first point with frequency >= f
    [[nodiscard]] double interpolateSegment(size_t upper, double f) const noexcept {
        if (upper == 0) return points_.front().response;
        if (upper >= points_.size()) return points_.back().response;
        const ControlPoint& a = points_[upper - 1];
        const ControlPoint& b = points_[upper];
        return Interpolation::linearInterpolateAt(a.frequency, a.response,
                                                  b.frequency, b.response, f);
    }

    [[nodiscard]] std::string outOfDomainMessage(double frequency) const {
        return "frequency " + std::to_string(frequency) + " Hz is outside the response domain ["
            + std::to_string(minFrequency()) + ", " + std::to_string(maxFrequency()) + "] Hz";
    }

    ControlPoints points_;
};

} // namespace DSP
} // namespace Shapenoise
