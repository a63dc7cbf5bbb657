#include "voice_builder.hpp"
#include "pitch.hpp"
#include <algorithm>
#include <cmath>

namespace synth {

VoiceSynthesisBuilder::VoiceSynthesisBuilder(float sampleRate, unsigned int seed)
    : sampleRate_(sampleRate)
    , rng_(seed != 0 ? seed : std::random_device{}())
    , uniform_(0.0f, 1.0f) {
}

std::unique_ptr<HarmonicVoice> VoiceSynthesisBuilder::build(int midiNote, float velocity,
                                                            const presets::Preset& preset, double now) {
    const double fundamental = midiToFrequency(midiNote);
    const float nyquist = sampleRate_ / 2.0f;

    auto voice = std::make_unique<HarmonicVoice>(sampleRate_, midiNote, preset.id, now);

    // Filter sweeps down from the opened cutoff to the resting cutoff
    voice->setFilterResonance(preset.filterQ);
    voice->setFilterEnvelopeAmount(preset.filterEnvelope);
    float filterStart = std::min(preset.filterCutoff * (1.0f + preset.filterEnvelope), FILTER_START_LIMIT);
    voice->filterFrequency().setValueAtTime(filterStart, now);
    voice->filterFrequency().exponentialRampToValueAtTime(preset.filterCutoff,
                                                          now + preset.attack + preset.decay * 0.5);

    if (preset.hasSaturation()) {
        voice->setSaturation(curveCache_.curveFor(preset.saturationAmount));
    }

    if (preset.hasStereoSpread()) {
        voice->setPan((random() * 2.0f - 1.0f) * preset.stereoSpread);
    }

    if (preset.hasPluckNoise()) {
        const float length = std::max(MIN_PLUCK_SECONDS, preset.pluckNoiseDecay);
        std::vector<float> burst(static_cast<size_t>(std::floor(sampleRate_ * length)));
        for (size_t i = 0; i < burst.size(); ++i) {
            float t = static_cast<float>(i) / burst.size();
            float envelope = std::pow(1.0f - t, 3.0f);
            burst[i] = (random() * 2.0f - 1.0f) * envelope;
        }
        voice->setPluckNoise(std::move(burst), preset.pluckNoiseLevel);
    }

    if (preset.hasVibrato()) {
        voice->setVibrato(preset.vibratoRate, preset.vibratoDepth);
    }

    for (size_t index = 0; index < preset.harmonics.size(); ++index) {
        const float amplitude = preset.harmonics[index];
        if (amplitude <= 0.0f) {
            continue;
        }
        const int harmonic = static_cast<int>(index) + 1;
        const double frequency = fundamental * harmonic;
        if (frequency > nyquist) {
            continue;
        }
        const float detune = (random() - 0.5f) * preset.detuneSpread;
        const float gain = amplitude * std::pow(HARMONIC_ROLLOFF, static_cast<float>(index)) * PARTIAL_LEVEL;
        voice->addPartial(harmonic, static_cast<float>(frequency), amplitude, gain, detune);
    }

    // Linear attack to the velocity peak, then an asymptotic fall toward sustain
    const float peak = velocity * PEAK_PER_VELOCITY;
    const float sustainLevel = peak * preset.sustain;
    voice->mainGain().setValueAtTime(ENVELOPE_FLOOR, now);
    voice->mainGain().linearRampToValueAtTime(peak, now + preset.attack);
    voice->mainGain().setTargetAtTime(sustainLevel, now + preset.attack, preset.decay * 0.3);

    return voice;
}

} // namespace synth
