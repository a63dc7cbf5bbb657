#ifndef FFT_HPP
#define FFT_HPP

#include <complex>
#include <cstddef>
#include <vector>

namespace synth {

/**
 * @brief In-place iterative radix-2 FFT for power-of-two sizes
 *
 * Sized once; transforms never allocate. Inverse output is scaled by 1/N.
 */
class Fft {
public:
    explicit Fft(size_t size = 0);

    void resize(size_t size);
    size_t size() const { return size_; }

    void forward(std::vector<std::complex<float>>& data) const;
    void inverse(std::vector<std::complex<float>>& data) const;

    static bool isPowerOfTwo(size_t n) { return n != 0 && (n & (n - 1)) == 0; }

private:
    void transform(std::vector<std::complex<float>>& data, bool inverse) const;

    size_t size_ = 0;
    std::vector<size_t> bitReverse_;
    std::vector<std::complex<float>> twiddles_;
};

} // namespace synth

#endif // FFT_HPP
