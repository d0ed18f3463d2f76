#include "pileup/dsp.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace pileup {

BoxConvolver::BoxConvolver(size_t input_size, size_t width, float snap)
    : input_size_(input_size)
    , width_(width)
    , snap_(snap)
    , fft_(nextPowerOfTwo(std::max<size_t>(2, input_size + width)))
{
    if (width == 0) {
        throw std::invalid_argument("Convolution window must not be empty");
    }

    const size_t n = fft_.size();
    work_.assign(n, 0.0f);
    spectrum_.resize(n / 2 + 1);
    kernel_spectrum_.resize(n / 2 + 1);

    // Rectangular kernel, transformed once
    std::fill(work_.begin(), work_.begin() + std::min(width_, n), 1.0f);
    fft_.forwardReal(work_.data(), kernel_spectrum_.data());
}

std::vector<float> BoxConvolver::slidingSum(IntensitySpan in) {
    if (in.size() != input_size_) {
        throw std::invalid_argument("Convolution input size mismatch");
    }

    std::vector<float> out(outputSize());
    if (out.empty()) return out;

    const size_t n = fft_.size();
    std::fill(work_.begin(), work_.end(), 0.0f);
    std::copy(in.begin(), in.end(), work_.begin());

    fft_.forwardReal(work_.data(), spectrum_.data());
    for (size_t k = 0; k < spectrum_.size(); ++k) {
        spectrum_[k] *= kernel_spectrum_[k];
    }
    fft_.inverseReal(spectrum_.data(), work_.data());

    // Full linear convolution index (i + width - 1) is the sum of in[i .. i+width)
    for (size_t i = 0; i < out.size(); ++i) {
        size_t idx = i + width_ - 1;
        float v = idx < n ? work_[idx] : 0.0f;
        out[i] = std::fabs(v) < snap_ ? 0.0f : v;
    }
    return out;
}

} // namespace pileup
