#ifndef PRESET_HPP
#define PRESET_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace presets {

/**
 * @brief Timbre and envelope parameters for one instrument
 *
 * Times are in seconds, frequencies in Hz, filterQ in dB, vibratoDepth and
 * detuneSpread in cents. The optional stages (pluck noise, saturation,
 * stereo spread) are disabled when their amount is 0.
 *
 * Uses nlohmann/json for serialization; keys missing from a JSON object keep
 * the defaults below.
 */
struct Preset {
    std::string id;
    std::string name;

    // Relative amplitude of harmonic 1, 2, 3, ...
    std::vector<float> harmonics = {1.0f};

    // Amplitude envelope
    float attack = 0.01f;
    float decay = 0.5f;
    float sustain = 0.5f;
    float release = 0.5f;

    // Lowpass filter and its attack sweep
    float filterCutoff = 5000.0f;
    float filterQ = 0.7f;
    float filterEnvelope = 0.0f;

    // Pitch modulation
    float vibratoRate = 0.0f;
    float vibratoDepth = 0.0f;
    float detuneSpread = 0.0f;

    // Optional stages
    float pluckNoiseLevel = 0.0f;
    float pluckNoiseDecay = 0.12f;
    float saturationAmount = 0.0f;
    float stereoSpread = 0.0f;

    bool hasVibrato() const { return vibratoRate > 0.0f && vibratoDepth > 0.0f; }
    bool hasPluckNoise() const { return pluckNoiseLevel > 0.0f; }
    bool hasSaturation() const { return saturationAmount > 0.0f; }
    bool hasStereoSpread() const { return stereoSpread != 0.0f; }

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(Preset,
        id,
        name,
        harmonics,
        attack,
        decay,
        sustain,
        release,
        filterCutoff,
        filterQ,
        filterEnvelope,
        vibratoRate,
        vibratoDepth,
        detuneSpread,
        pluckNoiseLevel,
        pluckNoiseDecay,
        saturationAmount,
        stereoSpread
    )
};

} // namespace presets

#endif // PRESET_HPP
