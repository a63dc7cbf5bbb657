#ifndef HARMONIC_VOICE_HPP
#define HARMONIC_VOICE_HPP

#include "automation_param.hpp"
#include "biquad_filter.hpp"
#include "saturation_curve.hpp"
#include "sine_oscillator.hpp"
#include "voice_snapshot.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace synth {

/**
 * @brief Signal graph of one sounding note
 *
 *   partials (+ pluck noise) -> lowpass -> [saturation] -> [panner] -> main gain
 *
 * An optional vibrato LFO modulates every partial's detune, scaled by the
 * partial's harmonic number. The graph is assembled by VoiceSynthesisBuilder
 * and then only rendered, re-automated on release, and disconnected.
 *
 * render() adds into the caller's buffers and never allocates.
 */
class HarmonicVoice {
public:
    static constexpr unsigned int MAX_BLOCK_FRAMES = 128;

    HarmonicVoice(float sampleRate, int midiNote, std::string presetId, double startTime);

    HarmonicVoice(const HarmonicVoice&) = delete;
    HarmonicVoice& operator=(const HarmonicVoice&) = delete;

    /**
     * @brief Add one sine partial feeding the filter
     * @param harmonic Harmonic number (1 = fundamental)
     * @param amplitude Relative amplitude taken from the preset
     * @param gain Static gain applied to the partial
     * @param detuneCents Static detune
     */
    void addPartial(int harmonic, float frequencyHz, float amplitude, float gain, float detuneCents);

    /**
     * @brief Enable the shared vibrato LFO
     * @param depthCents Detune swing of the fundamental
     */
    void setVibrato(float rateHz, float depthCents);

    /**
     * @brief Add a one-shot noise burst into the filter
     * @param samples Burst waveform, starting at the voice start time
     * @param level Initial burst gain, ramping exponentially to 0.0001 by the burst end
     */
    void setPluckNoise(std::vector<float> samples, float level);

    void setSaturation(std::shared_ptr<const WaveshaperCurve> curve);

    /**
     * @brief Equal-power pan position in [-1, 1]
     */
    void setPan(float pan);

    void setFilterResonance(float resonanceDb);
    void setFilterEnvelopeAmount(float amount) { filterEnvelope_ = amount; }

    AutomationParam& mainGain() { return mainGain_; }
    AutomationParam& filterFrequency() { return filterFrequency_; }
    const AutomationParam& mainGain() const { return mainGain_; }
    const AutomationParam& filterFrequency() const { return filterFrequency_; }

    /**
     * @brief Render and add this voice into a stereo bus
     * @param startTime Engine time of the first frame
     */
    void render(float* left, float* right, unsigned int numFrames, double startTime);

    /**
     * @brief Stop every source and detach from the bus; repeat calls are no-ops
     */
    void disconnect();

    bool isConnected() const { return connected_; }

    /**
     * @brief Diagnostic view at engine time now
     */
    VoiceSnapshot snapshot(double now, bool released) const;

    int midiNote() const { return midiNote_; }
    const std::string& presetId() const { return presetId_; }
    double startTime() const { return startTime_; }
    size_t partialCount() const { return partials_.size(); }
    bool hasVibrato() const { return vibratoEnabled_; }
    bool hasPluckNoise() const { return !noise_.empty(); }
    bool isPluckNoisePlaying() const { return noisePosition_ < noise_.size(); }
    const std::vector<float>& pluckNoise() const { return noise_; }
    const AutomationParam& pluckNoiseGain() const { return noiseGain_; }
    bool hasSaturation() const { return shaper_ != nullptr; }
    bool hasPanner() const { return pannerEnabled_; }
    float pan() const { return pan_; }
    const WaveshaperCurve* saturationCurve() const {
        return shaper_ ? shaper_->curve().get() : nullptr;
    }

    /**
     * @brief Detune of each partial in cents, in harmonic order
     */
    std::vector<float> partialDetunes() const;
    std::vector<float> partialGains() const;
    std::vector<float> partialFrequencies() const;

private:
    void renderBlock(float* left, float* right, unsigned int numFrames, double startTime);

    struct Partial {
        int harmonic;
        float frequencyHz;
        float amplitude;
        float gain;
        float detuneCents;
        SineOscillator oscillator;
    };

    float sampleRate_;
    int midiNote_;
    std::string presetId_;
    double startTime_;
    bool connected_ = true;

    std::vector<Partial> partials_;

    bool vibratoEnabled_ = false;
    float vibratoRate_ = 0.0f;
    float vibratoDepth_ = 0.0f;
    SineOscillator lfo_;

    std::vector<float> noise_;
    AutomationParam noiseGain_;
    float noiseLevel_ = 0.0f;
    size_t noisePosition_ = 0;

    BiquadFilter filter_;
    AutomationParam filterFrequency_;
    float filterEnvelope_ = 0.0f;

    std::unique_ptr<Waveshaper> shaper_;

    bool pannerEnabled_ = false;
    float pan_ = 0.0f;
    float panLeft_ = 1.0f;
    float panRight_ = 1.0f;

    AutomationParam mainGain_;

    // Per-block automation values
    float gainBlock_[MAX_BLOCK_FRAMES];
    float cutoffBlock_[MAX_BLOCK_FRAMES];
    float noiseGainBlock_[MAX_BLOCK_FRAMES];
};

} // namespace synth

#endif // HARMONIC_VOICE_HPP
