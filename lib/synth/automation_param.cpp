#include "automation_param.hpp"
#include <algorithm>
#include <cmath>

namespace synth {

namespace {

constexpr size_t RESERVED_EVENTS = 8;

double approachTarget(double startValue, double target, double startTime,
                      double timeConstant, double time) {
    if (timeConstant <= 0.0) {
        return target;
    }
    return target + (startValue - target) * std::exp(-(time - startTime) / timeConstant);
}

} // namespace

AutomationParam::AutomationParam(float defaultValue)
    : defaultValue_(defaultValue) {
    events_.reserve(RESERVED_EVENTS);
}

void AutomationParam::setValueAtTime(float value, double time) {
    insertEvent(Event{EventType::SET_VALUE, time, value, 0.0});
}

void AutomationParam::linearRampToValueAtTime(float value, double endTime) {
    insertEvent(Event{EventType::LINEAR_RAMP, endTime, value, 0.0});
}

void AutomationParam::exponentialRampToValueAtTime(float value, double endTime) {
    insertEvent(Event{EventType::EXPONENTIAL_RAMP, endTime, value, 0.0});
}

void AutomationParam::setTargetAtTime(float target, double startTime, double timeConstant) {
    insertEvent(Event{EventType::SET_TARGET, startTime, target, timeConstant});
}

void AutomationParam::cancelScheduledValues(double time) {
    events_.erase(std::remove_if(events_.begin(), events_.end(),
                                 [time](const Event& e) { return e.time >= time; }),
                  events_.end());
}

void AutomationParam::insertEvent(const Event& event) {
    // Upper bound keeps same-time events in insertion order
    auto pos = std::upper_bound(events_.begin(), events_.end(), event.time,
                                [](double t, const Event& e) { return t < e.time; });
    events_.insert(pos, event);
}

float AutomationParam::valueAt(double time) const {
    // Value and time at the end of the last event already passed
    double value = defaultValue_;
    double valueTime = 0.0;

    // Set while a setTarget curve is running
    bool targetActive = false;
    double targetValue = 0.0;
    double targetStart = 0.0;
    double targetTimeConstant = 0.0;

    for (const Event& e : events_) {
        if (e.type == EventType::LINEAR_RAMP || e.type == EventType::EXPONENTIAL_RAMP) {
            if (targetActive) {
                value = approachTarget(value, targetValue, targetStart, targetTimeConstant, valueTime);
                targetActive = false;
            }
            if (time < e.time) {
                double span = e.time - valueTime;
                if (span <= 0.0) {
                    return static_cast<float>(value);
                }
                double fraction = (time - valueTime) / span;
                if (fraction < 0.0) fraction = 0.0;
                if (e.type == EventType::LINEAR_RAMP) {
                    return static_cast<float>(value + (e.value - value) * fraction);
                }
                if (value == 0.0 || e.value == 0.0 || (value < 0.0) != (e.value < 0.0)) {
                    return static_cast<float>(value);
                }
                return static_cast<float>(value * std::pow(e.value / value, fraction));
            }
            value = e.value;
            valueTime = e.time;
            continue;
        }

        if (time < e.time) {
            break;
        }

        if (e.type == EventType::SET_VALUE) {
            value = e.value;
            valueTime = e.time;
            targetActive = false;
        } else {
            if (targetActive) {
                value = approachTarget(value, targetValue, targetStart, targetTimeConstant, e.time);
            }
            targetActive = true;
            targetValue = e.value;
            targetStart = e.time;
            targetTimeConstant = e.timeConstant;
            valueTime = e.time;
        }
    }

    if (targetActive) {
        return static_cast<float>(approachTarget(value, targetValue, targetStart, targetTimeConstant, time));
    }
    return static_cast<float>(value);
}

void AutomationParam::fillBlock(double startTime, double sampleRate, float* out, unsigned int numFrames) const {
    if (events_.empty()) {
        std::fill(out, out + numFrames, defaultValue_);
        return;
    }
    const double dt = 1.0 / sampleRate;
    for (unsigned int i = 0; i < numFrames; ++i) {
        out[i] = valueAt(startTime + i * dt);
    }
}

} // namespace synth
