#ifndef SINE_OSCILLATOR_HPP
#define SINE_OSCILLATOR_HPP

#include <cmath>
#include <cstddef>

namespace synth {

/**
 * @brief Table-lookup sine oscillator with cent-based detune
 *
 * All instances share one read-only sine table. Phase starts at zero, so the
 * first sample of a freshly started oscillator is 0.
 */
class SineOscillator {
public:
    static constexpr size_t TABLE_SIZE = 2048;

    explicit SineOscillator(float sampleRate = 44100.0f)
        : sampleRate_(sampleRate) {
        table();
    }

    inline void setFrequency(float frequencyHz) { frequencyHz_ = frequencyHz; }
    inline float getFrequency() const { return frequencyHz_; }

    /**
     * @brief Static detune in cents, added to any per-sample modulation
     */
    inline void setDetune(float cents) { detuneCents_ = cents; }
    inline float getDetune() const { return detuneCents_; }

    /**
     * @brief Generate the next sample
     * @param detuneModCents Extra detune for this sample (vibrato)
     */
    inline float nextSample(float detuneModCents = 0.0f) {
        const float* wave = table();

        double tablePos = phase_ * TABLE_SIZE;
        size_t index0 = static_cast<size_t>(tablePos);
        double frac = tablePos - static_cast<double>(index0);
        float sample = static_cast<float>(wave[index0] + (wave[index0 + 1] - wave[index0]) * frac);

        float cents = detuneCents_ + detuneModCents;
        double frequency = frequencyHz_;
        if (cents != 0.0f) {
            frequency *= std::exp2(cents / 1200.0);
        }
        phase_ += frequency / sampleRate_;
        phase_ -= std::floor(phase_);

        return sample;
    }

    inline void reset() { phase_ = 0.0; }

private:
    struct SineTable {
        // One guard point past the end so interpolation never wraps
        float wave[TABLE_SIZE + 1];

        SineTable() {
            const double TWO_PI = 6.283185307179586476925;
            for (size_t i = 0; i <= TABLE_SIZE; ++i) {
                wave[i] = static_cast<float>(std::sin(TWO_PI * i / TABLE_SIZE));
            }
        }
    };

    static const float* table() {
        static const SineTable sineTable;
        return sineTable.wave;
    }

    double phase_ = 0.0;
    float frequencyHz_ = 440.0f;
    float detuneCents_ = 0.0f;
    float sampleRate_;
};

} // namespace synth

#endif // SINE_OSCILLATOR_HPP
