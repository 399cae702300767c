// ==============================================================================
// Layer 0: Core Utilities
// random.h - Seedable Pseudo-Random Number Generation
// ==============================================================================
// No allocation, no locks, no exceptions, no I/O.
//
// Phase randomization draws from an explicit generator instance rather than a
// process-wide source, so every synthesis call can be made reproducible by
// seeding the generator it is handed.
// ==============================================================================

#pragma once

#include <cstdint>

namespace Shapenoise {
namespace DSP {

// ==============================================================================
// Xorshift32 PRNG
// ==============================================================================

/// Fast 32-bit pseudo-random number generator using xorshift algorithm.
///
/// Xorshift32 provides a good balance of speed and quality for phase
/// randomization. It has a period of 2^32-1 and passes most statistical tests.
///
/// Algorithm: Marsaglia's xorshift with shifts 13, 17, 5
///
/// @note NOT cryptographically secure - for audio/DSP use only
/// @note One instance must not be shared between threads without external
///       serialization
///
/// @example Basic usage:
///     Xorshift32 rng(12345);
///     float u = rng.nextUnitFloat();  // Returns [0.0, 1.0)
///
class Xorshift32 {
public:
    /// Construct with seed value.
    /// @param seedValue Initial seed (0 is automatically replaced with default)
    explicit constexpr Xorshift32(uint32_t seedValue = 1) noexcept
        : state_(seedValue != 0 ? seedValue : kDefaultSeed) {}

    /// Generate next 32-bit unsigned integer.
    /// @return Random uint32_t in range [1, 2^32-1]
    [[nodiscard]] constexpr uint32_t next() noexcept {
        state_ ^= state_ << 13;
        state_ ^= state_ >> 17;
        state_ ^= state_ << 5;
        return state_;
    }

    /// Generate next float in the half-open unit interval.
    /// @return Random float in range [0.0, 1.0), never exactly 1.0
    ///
    /// Uses the top 24 bits so every result is exactly representable and the
    /// upper bound stays excluded after conversion.
    [[nodiscard]] constexpr float nextUnitFloat() noexcept {
        return static_cast<float>(next() >> 8) * kInv2Pow24;
    }

    /// Reseed the generator.
    /// @param seedValue New seed (0 is automatically replaced with default)
    constexpr void seed(uint32_t seedValue) noexcept {
        state_ = (seedValue != 0) ? seedValue : kDefaultSeed;
    }

    /// Get current state (for debugging/serialization).
    /// @return Current internal state
    [[nodiscard]] constexpr uint32_t state() const noexcept {
        return state_;
    }

private:
    /// Default seed used when 0 is passed (0 would cause generator to output only zeros)
    static constexpr uint32_t kDefaultSeed = 2463534242u;

    /// 1 / 2^24
    static constexpr float kInv2Pow24 = 5.9604644775390625e-08f;

    uint32_t state_;
};

} // namespace DSP
} // namespace Shapenoise
