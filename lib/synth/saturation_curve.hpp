#ifndef SATURATION_CURVE_HPP
#define SATURATION_CURVE_HPP

#include <cstddef>
#include <map>
#include <memory>
#include <vector>

namespace synth {

using WaveshaperCurve = std::vector<float>;

/**
 * @brief Build a soft-saturation transfer curve
 *
 * curve(x) = ((1 + k) x) / (1 + k |x|) with k = max(1, 40 * amount),
 * sampled at CURVE_SIZE points across [-1, 1).
 */
std::shared_ptr<const WaveshaperCurve> createSaturationCurve(float amount);

/**
 * @brief Reuses saturation curves keyed by amount rounded to 3 decimals
 *
 * Voices hold shared pointers to the curve they were built with, so
 * clearing the cache never invalidates a sounding voice.
 */
class SaturationCurveCache {
public:
    static constexpr size_t CURVE_SIZE = 8192;

    std::shared_ptr<const WaveshaperCurve> curveFor(float amount);

    size_t size() const { return curves_.size(); }
    void clear() { curves_.clear(); }

private:
    std::map<long, std::shared_ptr<const WaveshaperCurve>> curves_;
};

/**
 * @brief Waveshaper stage reading a shared transfer curve
 *
 * Input in [-1, 1] maps linearly onto the curve with interpolation between
 * neighbouring points; inputs outside clamp to the end points.
 */
class Waveshaper {
public:
    explicit Waveshaper(std::shared_ptr<const WaveshaperCurve> curve)
        : curve_(std::move(curve)) {}

    inline float processSample(float input) const {
        const WaveshaperCurve& c = *curve_;
        const size_t n = c.size();
        float position = 0.5f * (n - 1) * (input + 1.0f);
        if (position <= 0.0f) {
            return c[0];
        }
        if (position >= static_cast<float>(n - 1)) {
            return c[n - 1];
        }
        size_t index = static_cast<size_t>(position);
        float frac = position - static_cast<float>(index);
        return c[index] + (c[index + 1] - c[index]) * frac;
    }

    const std::shared_ptr<const WaveshaperCurve>& curve() const { return curve_; }

private:
    std::shared_ptr<const WaveshaperCurve> curve_;
};

} // namespace synth

#endif // SATURATION_CURVE_HPP
