#ifndef EFFECTS_BUS_HPP
#define EFFECTS_BUS_HPP

#include "convolution_reverb.hpp"
#include "dynamics_compressor.hpp"
#include "impulse_response.hpp"
#include <vector>

namespace synth {

/**
 * @brief Shared output stage every voice feeds into
 *
 *   voices -> master gain -+-> dry gain ----------+-> compressor -> out
 *                          +-> reverb -> wet gain -+
 *
 * Dry and wet gains always sum to one, so changing the reverb mix is a
 * crossfade rather than an added layer. Topology is fixed at construction;
 * only the master gain and mix change afterwards.
 */
class EffectsBus {
public:
    static constexpr float DEFAULT_REVERB_MIX = 0.2f;

    /**
     * @param sampleRate Output sample rate
     * @param blockSize Frames per process() call
     * @param volume Initial master gain
     * @param reverbMix Initial wet amount in [0, 1]
     * @param irSeed Seed for the generated reverb response (0 = random)
     */
    EffectsBus(float sampleRate, unsigned int blockSize, float volume = 1.0f,
               float reverbMix = DEFAULT_REVERB_MIX, unsigned int irSeed = 0);

    EffectsBus(const EffectsBus&) = delete;
    EffectsBus& operator=(const EffectsBus&) = delete;

    /**
     * @brief Run one block through the bus in place
     * @param left Left bus input, replaced by left output
     * @param right Right bus input, replaced by right output
     */
    void process(float* left, float* right);

    void setVolume(float volume);

    /**
     * @brief Set the wet amount, clamped to [0, 1]
     */
    void setReverbMix(float mix);

    float masterGain() const { return masterGain_; }
    float dryGain() const { return dryGain_; }
    float wetGain() const { return wetGain_; }
    unsigned int blockSize() const { return blockSize_; }

    const ConvolutionReverb& reverb() const { return reverb_; }
    const DynamicsCompressor& compressor() const { return compressor_; }

    /**
     * @brief Compressor settings used by the bus
     */
    static CompressorSettings busCompressorSettings();

private:
    unsigned int blockSize_;
    float masterGain_;
    float dryGain_ = 1.0f - DEFAULT_REVERB_MIX;
    float wetGain_ = DEFAULT_REVERB_MIX;

    ConvolutionReverb reverb_;
    DynamicsCompressor compressor_;

    std::vector<float> wetLeft_;
    std::vector<float> wetRight_;
};

} // namespace synth

#endif // EFFECTS_BUS_HPP
