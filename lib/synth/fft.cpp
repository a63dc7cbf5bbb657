#include "fft.hpp"
#include <cmath>
#include <utility>

namespace synth {

Fft::Fft(size_t size) {
    resize(size);
}

void Fft::resize(size_t size) {
    size_ = isPowerOfTwo(size) ? size : 0;
    bitReverse_.assign(size_, 0);
    twiddles_.assign(size_ / 2, std::complex<float>(1.0f, 0.0f));
    if (size_ == 0) {
        return;
    }

    size_t bits = 0;
    while ((static_cast<size_t>(1) << bits) < size_) {
        ++bits;
    }
    for (size_t i = 0; i < size_; ++i) {
        size_t x = i;
        size_t r = 0;
        for (size_t b = 0; b < bits; ++b) {
            r = (r << 1) | (x & 1);
            x >>= 1;
        }
        bitReverse_[i] = r;
    }

    // Forward twiddles e^(-2 pi i k / N); the inverse uses their conjugates
    const double TWO_PI = 6.283185307179586476925;
    for (size_t k = 0; k < size_ / 2; ++k) {
        double angle = -TWO_PI * static_cast<double>(k) / static_cast<double>(size_);
        twiddles_[k] = std::complex<float>(static_cast<float>(std::cos(angle)),
                                           static_cast<float>(std::sin(angle)));
    }
}

void Fft::forward(std::vector<std::complex<float>>& data) const {
    transform(data, false);
}

void Fft::inverse(std::vector<std::complex<float>>& data) const {
    transform(data, true);
    if (size_ == 0 || data.size() != size_) {
        return;
    }
    const float scale = 1.0f / static_cast<float>(size_);
    for (auto& v : data) {
        v *= scale;
    }
}

void Fft::transform(std::vector<std::complex<float>>& data, bool inverse) const {
    if (size_ == 0 || data.size() != size_) {
        return;
    }

    for (size_t i = 0; i < size_; ++i) {
        size_t j = bitReverse_[i];
        if (j > i) {
            std::swap(data[i], data[j]);
        }
    }

    for (size_t len = 2; len <= size_; len <<= 1) {
        const size_t half = len >> 1;
        const size_t stride = size_ / len;
        for (size_t i = 0; i < size_; i += len) {
            for (size_t j = 0; j < half; ++j) {
                std::complex<float> w = twiddles_[j * stride];
                if (inverse) {
                    w = std::conj(w);
                }
                const std::complex<float> u = data[i + j];
                const std::complex<float> v = data[i + j + half] * w;
                data[i + j] = u + v;
                data[i + j + half] = u - v;
            }
        }
    }
}

} // namespace synth
