#ifndef VOICE_BUILDER_HPP
#define VOICE_BUILDER_HPP

#include "harmonic_voice.hpp"
#include "saturation_curve.hpp"
#include <preset.hpp>
#include <memory>
#include <random>

namespace synth {

/**
 * @brief Turns a preset and a note into a fully automated HarmonicVoice
 *
 * Owns the random source for detune, pan and noise, and the shared
 * saturation curve cache.
 */
class VoiceSynthesisBuilder {
public:
    static constexpr float HARMONIC_ROLLOFF = 0.85f;
    static constexpr float PARTIAL_LEVEL = 0.3f;
    static constexpr float PEAK_PER_VELOCITY = 0.5f;
    static constexpr float ENVELOPE_FLOOR = 0.0001f;
    static constexpr float FILTER_START_LIMIT = 15000.0f;
    static constexpr float MIN_PLUCK_SECONDS = 0.05f;

    /**
     * @param seed Random seed, 0 draws one from std::random_device
     */
    VoiceSynthesisBuilder(float sampleRate, unsigned int seed = 0);

    /**
     * @brief Build a voice for midiNote starting at engine time now
     * @param velocity Note velocity in [0, 1]
     */
    std::unique_ptr<HarmonicVoice> build(int midiNote, float velocity,
                                         const presets::Preset& preset, double now);

    SaturationCurveCache& curveCache() { return curveCache_; }
    float sampleRate() const { return sampleRate_; }

private:
    float random() { return uniform_(rng_); }

    float sampleRate_;
    std::mt19937 rng_;
    std::uniform_real_distribution<float> uniform_;
    SaturationCurveCache curveCache_;
};

} // namespace synth

#endif // VOICE_BUILDER_HPP
