// ==============================================================================
// Layer 0: Core Utility - Synthesis Error Codes
// ==============================================================================
// Error taxonomy and result types for the spectral noise pipeline.
//
// Nothing in the library throws. Every fallible stage returns a result that
// carries an error code plus a human-readable message naming the violated
// constraint; callers test the result with operator bool.
// ==============================================================================

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace Shapenoise {
namespace DSP {

/// @brief Error codes reported by the synthesis pipeline
enum class SynthesisError : uint8_t {
    Success = 0,    ///< No error
    ConfigError,    ///< Rate/duration/epsilon configuration is missing or inconsistent
    DomainError,    ///< A frequency or response lies outside its valid domain
    InvalidPolicy,  ///< Boundary policy is not one of zero/flat/linear
    SilentSignal,   ///< Reconstructed signal is all zeros and cannot be normalized
    FftError,       ///< Transform backend could not be prepared for the size
    WriteError,     ///< Output file could not be written
    ReadError       ///< WAV file could not be read back
};

/// @brief Stable name for an error code (for logs and diagnostics)
[[nodiscard]] constexpr std::string_view errorName(SynthesisError error) noexcept {
    switch (error) {
        case SynthesisError::Success:       return "Success";
        case SynthesisError::ConfigError:   return "ConfigError";
        case SynthesisError::DomainError:   return "DomainError";
        case SynthesisError::InvalidPolicy: return "InvalidPolicyError";
        case SynthesisError::SilentSignal:  return "SilentSignal";
        case SynthesisError::FftError:      return "FftError";
        case SynthesisError::WriteError:    return "WriteError";
        case SynthesisError::ReadError:     return "ReadError";
    }
    return "Unknown";
}

// =============================================================================
// Status
// =============================================================================

/// @brief Outcome of an operation that produces no value
struct Status {
    SynthesisError error = SynthesisError::Success;
    std::string errorMessage;  ///< Human-readable error description

    [[nodiscard]] bool ok() const noexcept { return error == SynthesisError::Success; }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] static Status success() { return {}; }

    [[nodiscard]] static Status failure(SynthesisError code, std::string message) {
        return {code, std::move(message)};
    }
};

// =============================================================================
// Result
// =============================================================================

/// @brief Outcome of an operation that produces a value on success
/// @note value is default-constructed when error != Success
template <typename T>
struct Result {
    T value{};
    SynthesisError error = SynthesisError::Success;
    std::string errorMessage;

    [[nodiscard]] bool ok() const noexcept { return error == SynthesisError::Success; }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] Status status() const { return {error, errorMessage}; }

    [[nodiscard]] static Result success(T v) {
        Result r;
        r.value = std::move(v);
        return r;
    }

    [[nodiscard]] static Result failure(SynthesisError code, std::string message) {
        Result r;
        r.error = code;
        r.errorMessage = std::move(message);
        return r;
    }

    /// Forward another stage's failure unchanged
    [[nodiscard]] static Result failure(const Status& status) {
        return failure(status.error, status.errorMessage);
    }
};

} // namespace DSP
} // namespace Shapenoise
