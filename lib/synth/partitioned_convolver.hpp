#ifndef PARTITIONED_CONVOLVER_HPP
#define PARTITIONED_CONVOLVER_HPP

#include "fft.hpp"
#include <complex>
#include <cstddef>
#include <vector>

namespace synth {

/**
 * @brief Uniformly partitioned overlap-add FFT convolution
 *
 * The impulse response is cut into blockSize partitions, each transformed
 * once at FFT size 2 * blockSize. Every input block is transformed and kept
 * in a ring; output is the sum of ring spectra times partition spectra.
 * Latency-free: output block n contains the response to input block n.
 */
class PartitionedConvolver {
public:
    PartitionedConvolver() = default;

    /**
     * @brief Load an impulse response and size all work buffers
     * @param blockSize Frames per process() call (power of two)
     */
    void configure(const std::vector<float>& impulseResponse, size_t blockSize);

    /**
     * @brief Convolve one block of blockSize frames
     */
    void process(const float* input, float* output);

    size_t blockSize() const { return blockSize_; }
    size_t partitionCount() const { return partitions_.size(); }

private:
    size_t blockSize_ = 0;
    size_t fftSize_ = 0;
    size_t ringIndex_ = 0;

    Fft fft_;
    std::vector<std::vector<std::complex<float>>> partitions_;
    std::vector<std::vector<std::complex<float>>> inputRing_;

    std::vector<std::complex<float>> work_;
    std::vector<std::complex<float>> accumulator_;
    std::vector<float> overlap_;
};

} // namespace synth

#endif // PARTITIONED_CONVOLVER_HPP
