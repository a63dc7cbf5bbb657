#pragma once

#include <functional>

namespace features {

/**
 * @brief Receiver for events published by the engine
 *
 * Publishers hold a sink reference and never check whether anyone listens;
 * use NoTelemetrySink when nothing should be recorded.
 *
 * @tparam TelemetryDataT Event type
 */
template<typename TelemetryDataT>
class TelemetrySink {
public:
    virtual ~TelemetrySink() = default;

    /**
     * @brief Deliver one event; called on the control thread
     */
    virtual void sendTelemetry(const TelemetryDataT& data) = 0;
};

/**
 * @brief Discards every event
 */
template<typename TelemetryDataT>
class NoTelemetrySink : public TelemetrySink<TelemetryDataT> {
public:
    void sendTelemetry(const TelemetryDataT& /*data*/) override {}
};

/**
 * @brief Forwards every event to a callable
 */
template<typename TelemetryDataT>
class CallbackTelemetrySink : public TelemetrySink<TelemetryDataT> {
public:
    explicit CallbackTelemetrySink(std::function<void(const TelemetryDataT&)> callback)
        : callback_(std::move(callback)) {}

    void sendTelemetry(const TelemetryDataT& data) override {
        if (callback_) {
            callback_(data);
        }
    }

private:
    std::function<void(const TelemetryDataT&)> callback_;
};

} // namespace features
