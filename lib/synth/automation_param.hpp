#ifndef AUTOMATION_PARAM_HPP
#define AUTOMATION_PARAM_HPP

#include <cstddef>
#include <vector>

namespace synth {

/**
 * @brief Sample-accurate parameter timeline
 *
 * Holds a list of scheduled automation events on the engine clock and
 * evaluates the parameter at any time. Supports step changes, linear and
 * exponential ramps, and exponential approach toward a target. Events are
 * kept sorted by time; events sharing a time keep insertion order.
 *
 * Scheduling may allocate; evaluation never does.
 */
class AutomationParam {
public:
    explicit AutomationParam(float defaultValue = 0.0f);

    /**
     * @brief Set the value used when no automation event applies
     */
    void setValue(float value) { defaultValue_ = value; }

    void setValueAtTime(float value, double time);
    void linearRampToValueAtTime(float value, double endTime);

    /**
     * @brief Exponential ramp from the previous event's value
     *
     * A ramp whose start or end value is zero, or whose endpoints differ in
     * sign, holds the start value until endTime and then jumps.
     */
    void exponentialRampToValueAtTime(float value, double endTime);

    /**
     * @brief Exponential approach toward target starting at startTime
     * @param timeConstant Seconds for the distance to shrink by 1/e
     */
    void setTargetAtTime(float target, double startTime, double timeConstant);

    /**
     * @brief Remove every event scheduled at or after time
     */
    void cancelScheduledValues(double time);

    /**
     * @brief Evaluate the parameter at an engine time in seconds
     */
    float valueAt(double time) const;

    /**
     * @brief Fill a block with per-sample values
     * @param startTime Engine time of the first sample
     * @param sampleRate Sample rate in Hz
     */
    void fillBlock(double startTime, double sampleRate, float* out, unsigned int numFrames) const;

    bool hasEvents() const { return !events_.empty(); }
    size_t eventCount() const { return events_.size(); }

private:
    enum class EventType {
        SET_VALUE,
        LINEAR_RAMP,
        EXPONENTIAL_RAMP,
        SET_TARGET
    };

    struct Event {
        EventType type;
        double time;
        float value;
        double timeConstant;
    };

    void insertEvent(const Event& event);

    float defaultValue_;
    std::vector<Event> events_;
};

} // namespace synth

#endif // AUTOMATION_PARAM_HPP
