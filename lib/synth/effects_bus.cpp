#include "effects_bus.hpp"
#include <log.hpp>
#include <algorithm>

namespace synth {

CompressorSettings EffectsBus::busCompressorSettings() {
    CompressorSettings settings;
    settings.thresholdDb = -18.0f;
    settings.kneeDb = 20.0f;
    settings.ratio = 6.0f;
    settings.attackSeconds = 0.005f;
    settings.releaseSeconds = 0.2f;
    return settings;
}

EffectsBus::EffectsBus(float sampleRate, unsigned int blockSize, float volume,
                       float reverbMix, unsigned int irSeed)
    : blockSize_(blockSize)
    , masterGain_(volume)
    , compressor_(sampleRate, busCompressorSettings())
    , wetLeft_(blockSize, 0.0f)
    , wetRight_(blockSize, 0.0f) {
    setReverbMix(reverbMix);

    ImpulseResponseGenerator generator(irSeed);
    ImpulseResponse response = generator.generate(sampleRate);
    reverb_.configure(response, blockSize_);

    logInfo("Effects bus ready: %u-frame reverb response, mix %.2f, volume %.2f",
            static_cast<unsigned int>(response.length()), wetGain_, masterGain_);
}

void EffectsBus::setVolume(float volume) {
    masterGain_ = std::max(0.0f, volume);
}

void EffectsBus::setReverbMix(float mix) {
    mix = std::min(1.0f, std::max(0.0f, mix));
    wetGain_ = mix;
    dryGain_ = 1.0f - mix;
}

void EffectsBus::process(float* left, float* right) {
    for (unsigned int i = 0; i < blockSize_; ++i) {
        left[i] *= masterGain_;
        right[i] *= masterGain_;
    }

    reverb_.process(left, right, wetLeft_.data(), wetRight_.data());

    for (unsigned int i = 0; i < blockSize_; ++i) {
        left[i] = left[i] * dryGain_ + wetLeft_[i] * wetGain_;
        right[i] = right[i] * dryGain_ + wetRight_[i] * wetGain_;
    }

    compressor_.process(left, right, blockSize_);
}

} // namespace synth
