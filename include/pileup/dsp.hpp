#pragma once

#include "types.hpp"
#include <complex>
#include <memory>

namespace pileup {

using Complex = std::complex<float>;

/**
 * Real FFT wrapper
 *
 * Abstracts FFTW3 (if available) or fallback implementation.
 * N real samples <-> N/2+1 complex bins.
 */
class FFT {
public:
    explicit FFT(size_t size);
    ~FFT();

    FFT(const FFT&) = delete;
    FFT& operator=(const FFT&) = delete;

    // Real forward FFT: N real -> N/2+1 complex
    void forwardReal(const float* in, Complex* out);

    // Real inverse FFT: N/2+1 complex -> N real (normalized)
    void inverseReal(const Complex* in, float* out);

    size_t size() const { return size_; }

private:
    size_t size_;
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Smallest power of two >= n
size_t nextPowerOfTwo(size_t n);

/**
 * Box-window convolution
 *
 * Sum of every `width`-long run of the input, computed as a linear
 * convolution with a rectangular kernel in the frequency domain.
 * Output index i covers input [i, i + width); the result has
 * in.size() - width + 1 entries (empty if width > in.size()).
 *
 * Results with magnitude below `snap` are set to exactly zero so empty
 * regions compare equal despite FFT round-off.
 */
class BoxConvolver {
public:
    BoxConvolver(size_t input_size, size_t width, float snap = 0.05f);

    std::vector<float> slidingSum(IntensitySpan in);

    size_t inputSize() const { return input_size_; }
    size_t width() const { return width_; }
    size_t outputSize() const {
        return width_ <= input_size_ ? input_size_ - width_ + 1 : 0;
    }

private:
    size_t input_size_;
    size_t width_;
    float snap_;
    FFT fft_;
    std::vector<Complex> kernel_spectrum_;
    std::vector<float> work_;
    std::vector<Complex> spectrum_;
};

} // namespace pileup
