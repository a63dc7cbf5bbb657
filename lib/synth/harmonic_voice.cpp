#include "harmonic_voice.hpp"
#include "pitch.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace synth {

namespace {

constexpr float NOISE_FLOOR = 0.0001f;
constexpr float DEFAULT_FILTER_FREQUENCY = 350.0f;

std::string formatNode(const char* format, size_t index, double value) {
    char text[64];
    snprintf(text, sizeof(text), format, index, value);
    return text;
}

} // namespace

HarmonicVoice::HarmonicVoice(float sampleRate, int midiNote, std::string presetId, double startTime)
    : sampleRate_(sampleRate)
    , midiNote_(midiNote)
    , presetId_(std::move(presetId))
    , startTime_(startTime)
    , lfo_(sampleRate)
    , noiseGain_(1.0f)
    , filter_(sampleRate)
    , filterFrequency_(DEFAULT_FILTER_FREQUENCY)
    , mainGain_(0.0f) {
    filter_.setResonanceDb(0.0f);
}

void HarmonicVoice::addPartial(int harmonic, float frequencyHz, float amplitude, float gain, float detuneCents) {
    Partial partial{harmonic, frequencyHz, amplitude, gain, detuneCents, SineOscillator(sampleRate_)};
    partial.oscillator.setFrequency(frequencyHz);
    partial.oscillator.setDetune(detuneCents);
    partials_.push_back(partial);
}

void HarmonicVoice::setVibrato(float rateHz, float depthCents) {
    vibratoEnabled_ = true;
    vibratoRate_ = rateHz;
    vibratoDepth_ = depthCents;
    lfo_.setFrequency(rateHz);
    lfo_.reset();
}

void HarmonicVoice::setPluckNoise(std::vector<float> samples, float level) {
    noise_ = std::move(samples);
    noiseLevel_ = level;
    noisePosition_ = 0;

    const double length = static_cast<double>(noise_.size()) / sampleRate_;
    noiseGain_.setValueAtTime(level, startTime_);
    noiseGain_.exponentialRampToValueAtTime(NOISE_FLOOR, startTime_ + length);
}

void HarmonicVoice::setSaturation(std::shared_ptr<const WaveshaperCurve> curve) {
    shaper_ = std::make_unique<Waveshaper>(std::move(curve));
}

void HarmonicVoice::setPan(float pan) {
    const float HALF_PI = 1.57079632679489661923f;
    pan = std::min(1.0f, std::max(-1.0f, pan));
    pannerEnabled_ = true;
    pan_ = pan;
    float x = (pan + 1.0f) * 0.5f;
    panLeft_ = std::cos(x * HALF_PI);
    panRight_ = std::sin(x * HALF_PI);
}

void HarmonicVoice::setFilterResonance(float resonanceDb) {
    filter_.setResonanceDb(resonanceDb);
}

void HarmonicVoice::render(float* left, float* right, unsigned int numFrames, double startTime) {
    if (!connected_) {
        return;
    }
    unsigned int offset = 0;
    while (offset < numFrames) {
        unsigned int chunk = std::min(MAX_BLOCK_FRAMES, numFrames - offset);
        renderBlock(left + offset, right + offset, chunk, startTime + offset / static_cast<double>(sampleRate_));
        offset += chunk;
    }
}

void HarmonicVoice::renderBlock(float* left, float* right, unsigned int numFrames, double startTime) {
    mainGain_.fillBlock(startTime, sampleRate_, gainBlock_, numFrames);
    filterFrequency_.fillBlock(startTime, sampleRate_, cutoffBlock_, numFrames);
    const bool noiseActive = noisePosition_ < noise_.size();
    if (noiseActive) {
        noiseGain_.fillBlock(startTime, sampleRate_, noiseGainBlock_, numFrames);
    }

    for (unsigned int i = 0; i < numFrames; ++i) {
        float vibrato = 0.0f;
        if (vibratoEnabled_) {
            vibrato = lfo_.nextSample() * vibratoDepth_;
        }

        float sample = 0.0f;
        for (Partial& partial : partials_) {
            sample += partial.oscillator.nextSample(vibrato * partial.harmonic) * partial.gain;
        }

        if (noisePosition_ < noise_.size()) {
            sample += noise_[noisePosition_++] * noiseGainBlock_[i];
        }

        filter_.setCutoff(cutoffBlock_[i]);
        sample = filter_.processSample(sample);

        if (shaper_) {
            sample = shaper_->processSample(sample);
        }

        sample *= gainBlock_[i];
        left[i] += sample * panLeft_;
        right[i] += sample * panRight_;
    }
}

void HarmonicVoice::disconnect() {
    if (!connected_) {
        return;
    }
    connected_ = false;
    noisePosition_ = noise_.size();
    filter_.reset();
}

std::vector<float> HarmonicVoice::partialDetunes() const {
    std::vector<float> result;
    for (const Partial& partial : partials_) {
        result.push_back(partial.detuneCents);
    }
    return result;
}

std::vector<float> HarmonicVoice::partialGains() const {
    std::vector<float> result;
    for (const Partial& partial : partials_) {
        result.push_back(partial.gain);
    }
    return result;
}

std::vector<float> HarmonicVoice::partialFrequencies() const {
    std::vector<float> result;
    for (const Partial& partial : partials_) {
        result.push_back(partial.frequencyHz);
    }
    return result;
}

VoiceSnapshot HarmonicVoice::snapshot(double now, bool released) const {
    VoiceSnapshot snap;
    snap.midiNote = midiNote_;
    snap.noteName = midiToNoteName(midiNote_);
    snap.age = now - startTime_;
    snap.released = released;
    snap.presetId = presetId_;

    for (const Partial& partial : partials_) {
        snap.oscillators.push_back(OscillatorSnapshot{
            partial.harmonic, partial.frequencyHz, partial.amplitude, partial.detuneCents});
        snap.gainValues.push_back(partial.gain);
    }

    snap.filterCutoff = filterFrequency_.valueAt(now);
    snap.filterQ = filter_.getResonanceDb();
    snap.filterEnvelope = filterEnvelope_;
    snap.mainGain = mainGain_.valueAt(now);

    size_t index = 0;
    if (shaper_) {
        snap.extraNodes.push_back("WaveShaper_" + std::to_string(index++));
    }
    if (pannerEnabled_) {
        snap.extraNodes.push_back(formatNode("StereoPanner_%zu (pan: %.2f)", index++, pan_));
    }
    if (!noise_.empty()) {
        float noiseGain = noisePosition_ < noise_.size() ? noiseGain_.valueAt(now) : 0.0f;
        snap.extraNodes.push_back(formatNode("NoiseGain_%zu (%.3f)", index++, noiseGain));
    }
    if (vibratoEnabled_) {
        snap.extraNodes.push_back(formatNode("LFO_%zu (%.2f Hz)", index++, vibratoRate_));
        snap.extraNodes.push_back(formatNode("LFODepth_%zu (%.1f cents)", index++, vibratoDepth_));
    }
    return snap;
}

} // namespace synth
