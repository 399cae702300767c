// ==============================================================================
// Layer 1: DSP Primitive - Fast Fourier Transform
// ==============================================================================
// Complex FFT of any length.
// Sizes pffft supports natively (N = 2^a * 3^b * 5^c, multiple of 16) run on
// pffft's SIMD transforms; every other size runs on FFTW's single-precision
// planner, which handles arbitrary lengths (e.g. 441000 = 2^3*3^2*5^3*7^2 at
// 44.1 kHz).
//
// Signal lengths here are duration * sampleRate, so the transform cannot
// assume a power of two.
//
// Backends: pffft (marton78 fork, BSD license), FFTW 3 (float, fftw3f)
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <type_traits>

#include <fftw3.h>
#include <pffft.h>

namespace Shapenoise {
namespace DSP {

// =============================================================================
// Complex Number (POD)
// =============================================================================

/// @brief Simple complex number for FFT operations
/// @note POD type for performance - no virtual functions
struct Complex {
    float real = 0.0f;  ///< Real component
    float imag = 0.0f;  ///< Imaginary component

    // -------------------------------------------------------------------------
    // Arithmetic Operators
    // -------------------------------------------------------------------------

    [[nodiscard]] constexpr Complex operator+(const Complex& other) const noexcept {
        return {real + other.real, imag + other.imag};
    }

    [[nodiscard]] constexpr Complex operator-(const Complex& other) const noexcept {
        return {real - other.real, imag - other.imag};
    }

    [[nodiscard]] constexpr Complex operator*(const Complex& other) const noexcept {
        return {
            real * other.real - imag * other.imag,
            real * other.imag + imag * other.real
        };
    }

    [[nodiscard]] constexpr Complex conjugate() const noexcept {
        return {real, -imag};
    }

    // -------------------------------------------------------------------------
    // Polar Representation
    // -------------------------------------------------------------------------

    /// @brief Get magnitude |z| = sqrt(real^2 + imag^2)
    [[nodiscard]] float magnitude() const noexcept {
        return std::sqrt(real * real + imag * imag);
    }

    /// @brief Get phase angle in radians
    [[nodiscard]] float phase() const noexcept {
        return std::atan2(imag, real);
    }
};

// =============================================================================
// RAII Helpers for Backend Resources
// =============================================================================

namespace detail {

struct PffftSetupDeleter {
    void operator()(PFFFT_Setup* s) const noexcept {
        if (s) pffft_destroy_setup(s);
    }
};

struct PffftAlignedDeleter {
    void operator()(void* p) const noexcept {
        if (p) pffft_aligned_free(p);
    }
};

struct FftwPlanDeleter {
    void operator()(fftwf_plan p) const noexcept {
        if (p) fftwf_destroy_plan(p);
    }
};

struct FftwBufferDeleter {
    void operator()(fftwf_complex* p) const noexcept {
        if (p) fftwf_free(p);
    }
};

using AlignedBuffer = std::unique_ptr<float, PffftAlignedDeleter>;
using SetupHandle = std::unique_ptr<PFFFT_Setup, PffftSetupDeleter>;
using FftwPlanHandle = std::unique_ptr<std::remove_pointer_t<fftwf_plan>, FftwPlanDeleter>;
using FftwBuffer = std::unique_ptr<fftwf_complex[], FftwBufferDeleter>;

/// Allocate a SIMD-aligned, zeroed float buffer via pffft
inline AlignedBuffer makeAlignedBuffer(size_t numFloats) noexcept {
    AlignedBuffer buffer{static_cast<float*>(pffft_aligned_malloc(numFloats * sizeof(float))),
                         PffftAlignedDeleter{}};
    if (buffer) std::fill_n(buffer.get(), numFloats, 0.0f);
    return buffer;
}

/// Allocate an FFTW-aligned buffer of numBins complex values
inline FftwBuffer makeFftwBuffer(size_t numBins) noexcept {
    return FftwBuffer{static_cast<fftwf_complex*>(fftwf_malloc(numBins * sizeof(fftwf_complex))),
                      FftwBufferDeleter{}};
}

} // namespace detail

// =============================================================================
// FFT Class
// =============================================================================

/// @brief Arbitrary-length complex FFT (pffft for native sizes, FFTW otherwise)
///
/// @par Conventions
/// - forward():  X[k] = sum_n x[n] * exp(-2*pi*i*k*n/N)   (unnormalized)
/// - inverse():  x[n] = (1/N) sum_k X[k] * exp(+2*pi*i*k*n/N)
///
/// @par Thread Safety
/// prepare() creates FFTW plans, and FFTW's planner is not thread-safe:
/// prepare instances from one thread at a time. forward()/inverse() on
/// distinct instances may run concurrently.
///
/// @par Usage
/// @code
/// FFT fft;
/// if (!fft.prepare(spectrum.size())) { /* FftError */ }
/// fft.inverse(spectrum.data(), timeDomain.data());
/// @endcode
class FFT {
public:
    FFT() noexcept = default;
    ~FFT() noexcept = default;

    // Non-copyable, movable (unique_ptr members enable default move)
    FFT(const FFT&) = delete;
    FFT& operator=(const FFT&) = delete;
    FFT(FFT&&) noexcept = default;
    FFT& operator=(FFT&&) noexcept = default;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// @brief Prepare FFT for given size (allocates backend plans and buffers)
    /// @param fftSize Any size >= 1
    /// @return false if the size is 0 or the backend could not be set up
    /// @note Allocates memory
    [[nodiscard]] bool prepare(size_t fftSize) noexcept {
        release();
        if (fftSize == 0 || fftSize > static_cast<size_t>(INT32_MAX)) return false;

        const int n = static_cast<int>(fftSize);
        const bool native = pffft_is_valid_size(n, PFFFT_COMPLEX) != 0;

        if (native) {
            setup_.reset(pffft_new_setup(n, PFFFT_COMPLEX));
            buf1_ = detail::makeAlignedBuffer(2 * fftSize);
            buf2_ = detail::makeAlignedBuffer(2 * fftSize);
            work_ = detail::makeAlignedBuffer(2 * fftSize);
            if (!setup_ || !buf1_ || !buf2_ || !work_) {
                release();
                return false;
            }
        } else {
            fftwIn_ = detail::makeFftwBuffer(fftSize);
            fftwOut_ = detail::makeFftwBuffer(fftSize);
            if (!fftwIn_ || !fftwOut_) {
                release();
                return false;
            }
            forwardPlan_.reset(fftwf_plan_dft_1d(n, fftwIn_.get(), fftwOut_.get(),
                                                 FFTW_FORWARD, FFTW_ESTIMATE));
            inversePlan_.reset(fftwf_plan_dft_1d(n, fftwIn_.get(), fftwOut_.get(),
                                                 FFTW_BACKWARD, FFTW_ESTIMATE));
            if (!forwardPlan_ || !inversePlan_) {
                release();
                return false;
            }
        }

        size_ = fftSize;
        fftw_ = !native;
        return true;
    }

    /// @brief Release all backend resources
    void release() noexcept {
        size_ = 0;
        fftw_ = false;
        setup_.reset();
        buf1_.reset();
        buf2_.reset();
        work_.reset();
        forwardPlan_.reset();
        inversePlan_.reset();
        fftwIn_.reset();
        fftwOut_.reset();
    }

    // -------------------------------------------------------------------------
    // Processing
    // -------------------------------------------------------------------------

    /// @brief Forward FFT: N complex samples -> N complex bins (unnormalized)
    /// @pre prepare() has been called
    void forward(const Complex* input, Complex* output) noexcept {
        if (!isPrepared() || input == nullptr || output == nullptr) return;
        if (fftw_) {
            fftwTransform(forwardPlan_.get(), input, output);
        } else {
            pffftTransform(input, output, PFFFT_FORWARD);
        }
    }

    /// @brief Inverse FFT: N complex bins -> N complex samples, scaled by 1/N
    /// @pre prepare() has been called
    void inverse(const Complex* input, Complex* output) noexcept {
        if (!isPrepared() || input == nullptr || output == nullptr) return;
        if (fftw_) {
            fftwTransform(inversePlan_.get(), input, output);
        } else {
            pffftTransform(input, output, PFFFT_BACKWARD);
        }

        const float scale = 1.0f / static_cast<float>(size_);
        for (size_t n = 0; n < size_; ++n) {
            output[n].real *= scale;
            output[n].imag *= scale;
        }
    }

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    /// @brief Get configured FFT size
    [[nodiscard]] size_t size() const noexcept { return size_; }

    /// @brief Check if prepare() has succeeded
    [[nodiscard]] bool isPrepared() const noexcept {
        return size_ > 0 && (fftw_ ? forwardPlan_ != nullptr : setup_ != nullptr);
    }

    /// @brief True when the size is not native to pffft and FFTW runs it
    [[nodiscard]] bool usesFftw() const noexcept { return fftw_; }

private:
    void pffftTransform(const Complex* input, Complex* output,
                        pffft_direction_t direction) noexcept {
        float* in = buf1_.get();
        for (size_t k = 0; k < size_; ++k) {
            in[2 * k] = input[k].real;
            in[2 * k + 1] = input[k].imag;
        }

        pffft_transform_ordered(setup_.get(), in, buf2_.get(), work_.get(), direction);

        const float* out = buf2_.get();
        for (size_t k = 0; k < size_; ++k) {
            output[k] = {out[2 * k], out[2 * k + 1]};
        }
    }

    void fftwTransform(fftwf_plan plan, const Complex* input, Complex* output) noexcept {
        fftwf_complex* in = fftwIn_.get();
        for (size_t k = 0; k < size_; ++k) {
            in[k][0] = input[k].real;
            in[k][1] = input[k].imag;
        }

        fftwf_execute(plan);

        const fftwf_complex* out = fftwOut_.get();
        for (size_t k = 0; k < size_; ++k) {
            output[k] = {out[k][0], out[k][1]};
        }
    }

    size_t size_ = 0;
    bool fftw_ = false;

    // pffft path
    detail::SetupHandle setup_;
    detail::AlignedBuffer buf1_;    // Input staging
    detail::AlignedBuffer buf2_;    // Output staging
    detail::AlignedBuffer work_;    // pffft work buffer

    // FFTW path (plans are bound to these buffers)
    detail::FftwBuffer fftwIn_;
    detail::FftwBuffer fftwOut_;
    detail::FftwPlanHandle forwardPlan_;
    detail::FftwPlanHandle inversePlan_;
};

} // namespace DSP
} // namespace Shapenoise
