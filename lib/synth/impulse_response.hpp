#ifndef IMPULSE_RESPONSE_HPP
#define IMPULSE_RESPONSE_HPP

#include <cstddef>
#include <random>
#include <vector>

namespace synth {

/**
 * @brief Multi-channel impulse response buffer
 */
struct ImpulseResponse {
    float sampleRate = 0.0f;
    std::vector<std::vector<float>> channels;

    size_t length() const { return channels.empty() ? 0 : channels[0].size(); }
};

/**
 * @brief Procedural room impulse response
 *
 * Stereo, floor(1.2 * sampleRate) frames. Each sample is uniform noise plus a
 * short sine shimmer during the first 80ms, both shaped by exp(-4t).
 * Channels are generated independently for stereo decorrelation.
 */
class ImpulseResponseGenerator {
public:
    static constexpr float LENGTH_SECONDS = 1.2f;
    static constexpr float DECAY_RATE = 4.0f;
    static constexpr float SHIMMER_SECONDS = 0.08f;
    static constexpr float SHIMMER_LEVEL = 0.3f;
    static constexpr float SHIMMER_STEP = 0.01f;

    /**
     * @param seed Noise seed, 0 draws one from std::random_device
     */
    explicit ImpulseResponseGenerator(unsigned int seed = 0);

    ImpulseResponse generate(float sampleRate);

private:
    std::mt19937 rng_;
};

} // namespace synth

#endif // IMPULSE_RESPONSE_HPP
