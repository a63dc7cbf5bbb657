#ifndef DYNAMICS_COMPRESSOR_HPP
#define DYNAMICS_COMPRESSOR_HPP

#include <cmath>

namespace synth {

struct CompressorSettings {
    float thresholdDb = -24.0f;
    float kneeDb = 30.0f;
    float ratio = 12.0f;
    float attackSeconds = 0.003f;
    float releaseSeconds = 0.25f;
};

/**
 * @brief Stereo-linked feed-forward compressor with soft knee
 *
 * A peak envelope follower (separate attack and release coefficients)
 * drives a static gain curve. Makeup gain is derived from the curve so that
 * a full-scale input lands at (1 / gain(0 dBFS))^0.6 of its compressed level.
 */
class DynamicsCompressor {
public:
    explicit DynamicsCompressor(float sampleRate = 44100.0f, const CompressorSettings& settings = CompressorSettings())
        : sampleRate_(sampleRate) {
        configure(settings);
    }

    void configure(const CompressorSettings& settings) {
        settings_ = settings;
        attackCoef_ = coefficient(settings.attackSeconds);
        releaseCoef_ = coefficient(settings.releaseSeconds);
        makeupDb_ = -0.6f * computeGainDb(0.0f);
    }

    /**
     * @brief Compress a stereo block in place
     */
    void process(float* left, float* right, unsigned int numFrames) {
        for (unsigned int i = 0; i < numFrames; ++i) {
            float peak = std::fmax(std::fabs(left[i]), std::fabs(right[i]));
            float coef = (peak > envelope_) ? attackCoef_ : releaseCoef_;
            envelope_ = coef * envelope_ + (1.0f - coef) * peak;

            float gainDb = computeGainDb(linearToDb(envelope_));
            reductionDb_ = -gainDb;

            float gain = dbToLinear(gainDb + makeupDb_);
            left[i] *= gain;
            right[i] *= gain;
        }
    }

    /**
     * @brief Static curve: gain change in dB for a detector level in dB
     */
    float computeGainDb(float inputDb) const {
        const float threshold = settings_.thresholdDb;
        const float knee = settings_.kneeDb;
        const float slope = 1.0f / settings_.ratio - 1.0f;

        if (inputDb < threshold - knee / 2.0f) {
            return 0.0f;
        }
        if (inputDb > threshold + knee / 2.0f || knee <= 0.0f) {
            return (inputDb - threshold) * slope;
        }
        float x = inputDb - threshold + knee / 2.0f;
        return slope * x * x / (2.0f * knee);
    }

    float getReductionDb() const { return reductionDb_; }
    float getMakeupDb() const { return makeupDb_; }
    const CompressorSettings& getSettings() const { return settings_; }

private:
    float coefficient(float seconds) const {
        if (seconds <= 0.0f) return 0.0f;
        return std::exp(-1.0f / (seconds * sampleRate_));
    }

    static float linearToDb(float linear) {
        if (linear <= 0.0f) return -100.0f;
        return 20.0f * std::log10(linear);
    }

    static float dbToLinear(float db) {
        return std::pow(10.0f, db / 20.0f);
    }

    float sampleRate_;
    CompressorSettings settings_;
    float attackCoef_ = 0.0f;
    float releaseCoef_ = 0.0f;
    float makeupDb_ = 0.0f;
    float envelope_ = 0.0f;
    float reductionDb_ = 0.0f;
};

} // namespace synth

#endif // DYNAMICS_COMPRESSOR_HPP
