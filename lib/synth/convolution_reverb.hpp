#ifndef CONVOLUTION_REVERB_HPP
#define CONVOLUTION_REVERB_HPP

#include "impulse_response.hpp"
#include "partitioned_convolver.hpp"
#include <cmath>
#include <cstddef>

namespace synth {

/**
 * @brief Stereo convolution reverb with loudness-normalized response
 *
 * The response is scaled by 1 / RMS power, calibrated to -58 dB and
 * corrected for sample rate against 44.1 kHz, so differently generated
 * responses play back at a similar perceived level. Left input convolves
 * with the left response, right with the right.
 */
class ConvolutionReverb {
public:
    static constexpr float GAIN_CALIBRATION_DB = -58.0f;
    static constexpr float GAIN_CALIBRATION_SAMPLE_RATE = 44100.0f;
    static constexpr float MIN_POWER = 0.000125f;

    void configure(const ImpulseResponse& response, size_t blockSize) {
        normalizationScale_ = normalizationScale(response);
        if (response.channels.empty()) {
            convolvers_[0].configure(std::vector<float>(), blockSize);
            convolvers_[1].configure(std::vector<float>(), blockSize);
            return;
        }

        const size_t last = response.channels.size() - 1;
        for (size_t c = 0; c < 2; ++c) {
            std::vector<float> scaled = response.channels[c <= last ? c : last];
            for (float& s : scaled) {
                s *= normalizationScale_;
            }
            convolvers_[c].configure(scaled, blockSize);
        }
    }

    /**
     * @brief Process one block of blockSize frames per channel
     */
    void process(const float* inLeft, const float* inRight, float* outLeft, float* outRight) {
        convolvers_[0].process(inLeft, outLeft);
        convolvers_[1].process(inRight, outRight);
    }

    float getNormalizationScale() const { return normalizationScale_; }

    static float normalizationScale(const ImpulseResponse& response) {
        double sumSquares = 0.0;
        for (const auto& channel : response.channels) {
            for (float s : channel) {
                sumSquares += static_cast<double>(s) * s;
            }
        }
        const double count = static_cast<double>(response.channels.size()) * response.length();
        float power = count > 0.0 ? static_cast<float>(std::sqrt(sumSquares / count)) : 0.0f;
        if (!std::isfinite(power) || power < MIN_POWER) {
            power = MIN_POWER;
        }

        float scale = 1.0f / power;
        scale *= std::pow(10.0f, GAIN_CALIBRATION_DB * 0.05f);
        if (response.sampleRate > 0.0f) {
            scale *= GAIN_CALIBRATION_SAMPLE_RATE / response.sampleRate;
        }
        return scale;
    }

private:
    PartitionedConvolver convolvers_[2];
    float normalizationScale_ = 1.0f;
};

} // namespace synth

#endif // CONVOLUTION_REVERB_HPP
