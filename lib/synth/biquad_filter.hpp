#ifndef BIQUAD_FILTER_HPP
#define BIQUAD_FILTER_HPP

#include <cmath>

namespace synth {

/**
 * @brief Resonant lowpass biquad (2nd order IIR)
 *
 * Direct Form II Transposed, RBJ cookbook coefficients. Resonance is given
 * in dB, so 0 dB is a Q of 1 and negative values flatten the peak.
 * Coefficients are recalculated lazily when cutoff or resonance change,
 * which happens every sample while the cutoff is being automated.
 */
class BiquadFilter {
public:
    explicit BiquadFilter(float sampleRate = 44100.0f)
        : sampleRate_(sampleRate) {
        reset();
        updateCoefficients();
    }

    /**
     * @brief Set cutoff frequency in Hz
     * @param frequencyHz Cutoff frequency (clamped to 20Hz - Nyquist)
     */
    inline void setCutoff(float frequencyHz) {
        float nyquist = sampleRate_ * 0.5f;
        if (frequencyHz < 20.0f) frequencyHz = 20.0f;
        if (frequencyHz > nyquist * 0.99f) frequencyHz = nyquist * 0.99f;

        if (cutoffHz_ != frequencyHz) {
            cutoffHz_ = frequencyHz;
            coeffsDirty_ = true;
        }
    }

    /**
     * @brief Set resonance in dB
     */
    inline void setResonanceDb(float resonanceDb) {
        if (resonanceDb < -40.0f) resonanceDb = -40.0f;
        if (resonanceDb > 40.0f) resonanceDb = 40.0f;

        if (resonanceDb_ != resonanceDb) {
            resonanceDb_ = resonanceDb;
            coeffsDirty_ = true;
        }
    }

    inline float processSample(float input) {
        if (coeffsDirty_) {
            updateCoefficients();
        }

        float output = b0_ * input + z1_;
        z1_ = b1_ * input - a1_ * output + z2_;
        z2_ = b2_ * input - a2_ * output;

        return output;
    }

    inline void reset() {
        z1_ = 0.0f;
        z2_ = 0.0f;
    }

    inline float getCutoff() const { return cutoffHz_; }
    inline float getResonanceDb() const { return resonanceDb_; }

private:
    inline void updateCoefficients() {
        const float PI = 3.14159265358979323846f;

        float q = std::pow(10.0f, resonanceDb_ / 20.0f);
        float w0 = 2.0f * PI * cutoffHz_ / sampleRate_;
        float cosw0 = std::cos(w0);
        float alpha = std::sin(w0) / (2.0f * q);

        float a0 = 1.0f + alpha;
        b0_ = ((1.0f - cosw0) / 2.0f) / a0;
        b1_ = (1.0f - cosw0) / a0;
        b2_ = b0_;
        a1_ = (-2.0f * cosw0) / a0;
        a2_ = (1.0f - alpha) / a0;

        coeffsDirty_ = false;
    }

    float sampleRate_;

    float cutoffHz_ = 350.0f;
    float resonanceDb_ = 1.0f;

    float b0_ = 1.0f, b1_ = 0.0f, b2_ = 0.0f;
    float a1_ = 0.0f, a2_ = 0.0f;

    float z1_ = 0.0f;
    float z2_ = 0.0f;

    bool coeffsDirty_ = true;
};

} // namespace synth

#endif // BIQUAD_FILTER_HPP
