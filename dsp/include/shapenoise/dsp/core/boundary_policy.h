// ==============================================================================
// Layer 0: Core Utility - Boundary Policy Definitions
// ==============================================================================
// How a response curve continues past the outermost control points, toward
// 0 Hz on the low side and toward nyquist on the high side.
// ==============================================================================

#pragma once

#include <shapenoise/dsp/core/synthesis_error.h>

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace Shapenoise::DSP {

// =============================================================================
// BoundaryPolicy Enumeration
// =============================================================================

/// Continuation rule between an extreme control point and its spectrum limit
enum class BoundaryPolicy : uint8_t {
    Zero = 0,   ///< Response drops to 0 eps Hz past the control point and stays 0
    Flat,       ///< Extreme control response is held constant out to the limit
    Linear      ///< Response ramps linearly to 0 at the limit
};

inline constexpr int kBoundaryPolicyCount = 3;
inline constexpr BoundaryPolicy kDefaultBoundaryPolicy = BoundaryPolicy::Linear;

/// True for the three named policies; false for any other raw enum value
[[nodiscard]] inline constexpr bool isValidBoundaryPolicy(BoundaryPolicy policy) noexcept {
    return static_cast<int>(policy) < kBoundaryPolicyCount;
}

/// Get the lowercase policy name used on command lines and in messages
/// @return "zero", "flat", "linear", or "unknown"
[[nodiscard]] inline constexpr const char* getBoundaryPolicyName(BoundaryPolicy policy) noexcept {
    constexpr const char* kNames[] = {
        "zero",
        "flat",
        "linear"
    };
    const auto index = static_cast<size_t>(policy);
    return (index < kBoundaryPolicyCount) ? kNames[index] : "unknown";
}

/// Message reported for an unknown policy on the given side
/// @param field "lb_type" or "ub_type"
[[nodiscard]] inline std::string invalidBoundaryPolicyMessage(std::string_view field) {
    return std::string(field) + " must be one of: 'zero', 'flat', 'linear'";
}

/// Parse a policy name, case-insensitively
/// @param name Policy name as given on a command line or in a request
/// @param field Side the name configures, used in the error message
/// @return The policy, or InvalidPolicy if the name is not zero/flat/linear
[[nodiscard]] inline Result<BoundaryPolicy> parseBoundaryPolicy(std::string_view name,
                                                                std::string_view field = "lb_type") {
    for (int i = 0; i < kBoundaryPolicyCount; ++i) {
        const auto policy = static_cast<BoundaryPolicy>(i);
        const std::string_view candidate = getBoundaryPolicyName(policy);
        if (candidate.size() != name.size()) continue;

        bool match = true;
        for (size_t c = 0; c < name.size(); ++c) {
            const auto lower = static_cast<char>(
                std::tolower(static_cast<unsigned char>(name[c])));
            if (lower != candidate[c]) {
                match = false;
                break;
            }
        }
        if (match) return Result<BoundaryPolicy>::success(policy);
    }
    return Result<BoundaryPolicy>::failure(SynthesisError::InvalidPolicy,
                                           invalidBoundaryPolicyMessage(field));
}

} // namespace Shapenoise::DSP
