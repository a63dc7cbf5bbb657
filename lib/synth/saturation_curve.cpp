#include "saturation_curve.hpp"
#include <algorithm>
#include <cmath>

namespace synth {

std::shared_ptr<const WaveshaperCurve> createSaturationCurve(float amount) {
    const float k = std::max(1.0f, amount * 40.0f);
    auto curve = std::make_shared<WaveshaperCurve>(SaturationCurveCache::CURVE_SIZE);
    const size_t n = curve->size();
    for (size_t i = 0; i < n; ++i) {
        float x = (static_cast<float>(i) / n) * 2.0f - 1.0f;
        (*curve)[i] = ((1.0f + k) * x) / (1.0f + k * std::fabs(x));
    }
    return curve;
}

std::shared_ptr<const WaveshaperCurve> SaturationCurveCache::curveFor(float amount) {
    long key = std::lround(amount * 1000.0f);
    auto it = curves_.find(key);
    if (it != curves_.end()) {
        return it->second;
    }
    auto curve = createSaturationCurve(amount);
    curves_.emplace(key, curve);
    return curve;
}

} // namespace synth
