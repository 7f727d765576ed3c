// ==============================================================================
// Layer 1: DSP Primitive - Fast Fourier Transform
// ==============================================================================
// Real FFT via pffft (Pretty Fast FFT), used by the soundtrack analyzer.
//
// Besides the plain forward transform it offers the two frame operations the
// analyzer needs:
// - magnitudeSpectrum: window, transform, |X[k]| for k = 0..N/2
// - analyticEnvelope:  |x + j*H{x}|, the Hilbert amplitude envelope, with the
//                      quadrature part taken by rotating every positive bin
//                      by -90 degrees and transforming back
//
// Backend: pffft (marton78 fork, BSD license)
// ==============================================================================

#pragma once

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstddef>
#include <memory>
#include <vector>

#include <hearth/dsp/core/math_constants.h>

#include <pffft.h>

namespace Hearth {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// Minimum supported FFT size
inline constexpr size_t kMinFFTSize = 256;

/// Maximum supported FFT size
inline constexpr size_t kMaxFFTSize = 8192;

// =============================================================================
// Complex Number (POD)
// =============================================================================

/// @brief Simple complex number for FFT output
struct Complex {
    float real = 0.0f;  ///< Real component
    float imag = 0.0f;  ///< Imaginary component

    /// @brief Get magnitude |z| = sqrt(real^2 + imag^2)
    [[nodiscard]] float magnitude() const noexcept {
        return std::sqrt(real * real + imag * imag);
    }
};

/// Symmetric Hann window: 0.5 - 0.5 cos(2 pi n / (N - 1))
[[nodiscard]] inline std::vector<float> hannWindow(size_t size) {
    std::vector<float> window(size, 1.0f);
    if (size < 2) return window;
    const double denom = static_cast<double>(size - 1);
    for (size_t i = 0; i < size; ++i) {
        window[i] = static_cast<float>(
            0.5 - 0.5 * std::cos(kTwoPiD * static_cast<double>(i) / denom));
    }
    return window;
}

// =============================================================================
// RAII Helpers for pffft Resources
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

/// Allocate a SIMD-aligned float buffer via pffft
inline std::unique_ptr<float, PffftAlignedDeleter> makeAlignedBuffer(size_t numFloats) {
    return {static_cast<float*>(pffft_aligned_malloc(numFloats * sizeof(float))),
            PffftAlignedDeleter{}};
}

} // namespace detail

// =============================================================================
// FFT Class
// =============================================================================

/// @brief Real FFT frame analysis (SIMD-accelerated via pffft)
class FFT {
public:
    FFT() noexcept = default;
    ~FFT() noexcept = default;

    FFT(const FFT&) = delete;
    FFT& operator=(const FFT&) = delete;
    FFT(FFT&&) noexcept = default;
    FFT& operator=(FFT&&) noexcept = default;

    /// @brief Prepare FFT for given size (allocates pffft setup and aligned buffers)
    /// @param fftSize Power of 2 in range [kMinFFTSize, kMaxFFTSize]
    /// @return false if the size is unsupported (the FFT is left unprepared)
    bool prepare(size_t fftSize) noexcept {
        size_ = 0;
        if (fftSize < kMinFFTSize || fftSize > kMaxFFTSize || !std::has_single_bit(fftSize)) {
            return false;
        }

        setup_.reset(pffft_new_setup(static_cast<int>(fftSize), PFFFT_REAL));
        if (!setup_) return false;

        buf1_ = detail::makeAlignedBuffer(fftSize);
        buf2_ = detail::makeAlignedBuffer(fftSize);
        work_ = detail::makeAlignedBuffer(fftSize);
        size_ = fftSize;
        return true;
    }

    /// @brief Forward FFT: real time-domain -> complex frequency-domain
    /// @param input N real samples
    /// @param output N/2+1 complex bins (DC to Nyquist)
    void forward(const float* input, Complex* output) noexcept {
        if (!isPrepared() || input == nullptr || output == nullptr) return;

        const size_t N = size_;
        transform(input, nullptr);

        //   pffft: [DC_real, Nyquist_real, Re(1), Im(1), Re(2), Im(2), ...]
        //   ours:  Complex[0]={DC,0}, Complex[k]={Re,Im}, Complex[N/2]={Nyq,0}
        const float* fftOut = buf2_.get();
        output[0] = {fftOut[0], 0.0f};
        output[N / 2] = {fftOut[1], 0.0f};
        for (size_t k = 1; k < N / 2; ++k) {
            output[k] = {fftOut[2 * k], fftOut[2 * k + 1]};
        }
    }

    /// @brief Magnitudes |X[k]| of the windowed frame, k = 0..N/2.
    /// @param input N real samples
    /// @param window N window gains, or nullptr for a rectangular window
    /// @param magnitudes N/2+1 outputs
    void magnitudeSpectrum(const float* input, const float* window, float* magnitudes) noexcept {
        if (!isPrepared() || input == nullptr || magnitudes == nullptr) return;

        const size_t N = size_;
        transform(input, window);

        const float* fftOut = buf2_.get();
        magnitudes[0] = std::abs(fftOut[0]);
        magnitudes[N / 2] = std::abs(fftOut[1]);
        for (size_t k = 1; k < N / 2; ++k) {
            magnitudes[k] = std::hypot(fftOut[2 * k], fftOut[2 * k + 1]);
        }
    }

    /// @brief Hilbert amplitude envelope of one frame (circular).
    ///
    /// DC and Nyquist carry no quadrature component, so a frame with a DC
    /// offset has envelope |x| where the AC part is zero.
    /// @param input N real samples
    /// @param envelope N outputs, sqrt(x^2 + H{x}^2)
    void analyticEnvelope(const float* input, float* envelope) noexcept {
        if (!isPrepared() || input == nullptr || envelope == nullptr) return;

        const size_t N = size_;
        transform(input, nullptr);

        // -j * X[k] for 0 < k < N/2: (re, im) -> (im, -re)
        float* spectrum = buf2_.get();
        spectrum[0] = 0.0f;
        spectrum[1] = 0.0f;
        for (size_t k = 1; k < N / 2; ++k) {
            const float re = spectrum[2 * k];
            spectrum[2 * k] = spectrum[2 * k + 1];
            spectrum[2 * k + 1] = -re;
        }

        // pffft's inverse is unscaled: IFFT(FFT(x)) = N * x
        pffft_transform_ordered(setup_.get(), spectrum, buf1_.get(), work_.get(), PFFFT_BACKWARD);
        const float scale = 1.0f / static_cast<float>(N);
        const float* quadrature = buf1_.get();
        for (size_t i = 0; i < N; ++i) {
            envelope[i] = std::hypot(input[i], quadrature[i] * scale);
        }
    }

    [[nodiscard]] size_t size() const noexcept { return size_; }

    /// @brief Get number of output bins (N/2+1)
    [[nodiscard]] size_t numBins() const noexcept { return size_ / 2 + 1; }

    [[nodiscard]] bool isPrepared() const noexcept { return size_ > 0 && setup_ != nullptr; }

private:
    // Stage (optionally windowed) input in buf1_, ordered spectrum into buf2_
    void transform(const float* input, const float* window) noexcept {
        float* staged = buf1_.get();
        if (window != nullptr) {
            for (size_t i = 0; i < size_; ++i) {
                staged[i] = input[i] * window[i];
            }
        } else {
            std::copy_n(input, size_, staged);
        }
        pffft_transform_ordered(setup_.get(), staged, buf2_.get(), work_.get(), PFFFT_FORWARD);
    }

    size_t size_ = 0;
    std::unique_ptr<PFFFT_Setup, detail::PffftSetupDeleter> setup_;
    std::unique_ptr<float, detail::PffftAlignedDeleter> buf1_;  // Input staging
    std::unique_ptr<float, detail::PffftAlignedDeleter> buf2_;  // Output staging
    std::unique_ptr<float, detail::PffftAlignedDeleter> work_;  // pffft work buffer
};

} // namespace DSP
} // namespace Hearth
