#include "impulse_response.hpp"
#include <cmath>

namespace synth {

ImpulseResponseGenerator::ImpulseResponseGenerator(unsigned int seed)
    : rng_(seed != 0 ? seed : std::random_device{}()) {
}

ImpulseResponse ImpulseResponseGenerator::generate(float sampleRate) {
    ImpulseResponse ir;
    ir.sampleRate = sampleRate;

    const size_t length = static_cast<size_t>(std::floor(sampleRate * LENGTH_SECONDS));
    const double shimmerEnd = sampleRate * SHIMMER_SECONDS;
    std::uniform_real_distribution<float> noise(-1.0f, 1.0f);

    ir.channels.assign(2, std::vector<float>(length));
    for (auto& channel : ir.channels) {
        for (size_t i = 0; i < length; ++i) {
            double t = static_cast<double>(i) / sampleRate;
            double decay = std::exp(-DECAY_RATE * t);
            double shimmer = (i < shimmerEnd) ? std::sin(i * SHIMMER_STEP) * SHIMMER_LEVEL : 0.0;
            channel[i] = static_cast<float>(noise(rng_) * decay + shimmer * decay);
        }
    }
    return ir;
}

} // namespace synth
