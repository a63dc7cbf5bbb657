#include "partitioned_convolver.hpp"
#include <algorithm>

namespace synth {

void PartitionedConvolver::configure(const std::vector<float>& impulseResponse, size_t blockSize) {
    blockSize_ = blockSize;
    fftSize_ = blockSize * 2;
    ringIndex_ = 0;
    fft_.resize(fftSize_);

    const size_t partitionCount = (impulseResponse.size() + blockSize - 1) / blockSize;
    partitions_.assign(partitionCount, std::vector<std::complex<float>>(fftSize_));

    for (size_t p = 0; p < partitionCount; ++p) {
        auto& spectrum = partitions_[p];
        const size_t offset = p * blockSize;
        const size_t count = std::min(blockSize, impulseResponse.size() - offset);
        for (size_t i = 0; i < count; ++i) {
            spectrum[i] = std::complex<float>(impulseResponse[offset + i], 0.0f);
        }
        fft_.forward(spectrum);
    }

    inputRing_.assign(std::max<size_t>(1, partitionCount),
                      std::vector<std::complex<float>>(fftSize_));
    work_.assign(fftSize_, std::complex<float>());
    accumulator_.assign(fftSize_, std::complex<float>());
    overlap_.assign(blockSize_, 0.0f);
}

void PartitionedConvolver::process(const float* input, float* output) {
    if (partitions_.empty()) {
        std::fill(output, output + blockSize_, 0.0f);
        return;
    }

    // Zero-padded spectrum of the newest input block
    auto& newest = inputRing_[ringIndex_];
    for (size_t i = 0; i < blockSize_; ++i) {
        newest[i] = std::complex<float>(input[i], 0.0f);
    }
    std::fill(newest.begin() + blockSize_, newest.end(), std::complex<float>());
    fft_.forward(newest);

    // Partition p pairs with the input block p blocks ago
    const size_t ringSize = inputRing_.size();
    std::fill(accumulator_.begin(), accumulator_.end(), std::complex<float>());
    for (size_t p = 0; p < partitions_.size(); ++p) {
        const auto& x = inputRing_[(ringIndex_ + ringSize - p) % ringSize];
        const auto& h = partitions_[p];
        for (size_t k = 0; k < fftSize_; ++k) {
            accumulator_[k] += x[k] * h[k];
        }
    }
    ringIndex_ = (ringIndex_ + 1) % ringSize;

    std::copy(accumulator_.begin(), accumulator_.end(), work_.begin());
    fft_.inverse(work_);

    for (size_t i = 0; i < blockSize_; ++i) {
        output[i] = work_[i].real() + overlap_[i];
        overlap_[i] = work_[i + blockSize_].real();
    }
}

} // namespace synth
