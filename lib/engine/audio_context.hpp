#ifndef AUDIO_CONTEXT_HPP
#define AUDIO_CONTEXT_HPP

#include "timer_queue.hpp"
#include <cstddef>
#include <cstdint>

namespace engine {

/**
 * @brief Rendering clock and deferred-task host for one engine instance
 *
 * Time advances only while RUNNING, by the number of frames rendered.
 * currentTime() is frames / sampleRate in seconds. Once CLOSED the context
 * cannot be resumed and holds no pending tasks.
 */
class AudioContext {
public:
    enum class State {
        SUSPENDED,
        RUNNING,
        CLOSED
    };

    explicit AudioContext(float sampleRate)
        : sampleRate_(sampleRate) {}

    AudioContext(const AudioContext&) = delete;
    AudioContext& operator=(const AudioContext&) = delete;

    float sampleRate() const { return sampleRate_; }
    double currentTime() const { return static_cast<double>(framesRendered_) / sampleRate_; }
    uint64_t framesRendered() const { return framesRendered_; }

    State state() const { return state_; }
    bool isRunning() const { return state_ == State::RUNNING; }

    void resume() {
        if (state_ == State::SUSPENDED) {
            state_ = State::RUNNING;
        }
    }

    void suspend() {
        if (state_ == State::RUNNING) {
            state_ = State::SUSPENDED;
        }
    }

    void close() {
        timers_.cancelAll();
        state_ = State::CLOSED;
    }

    /**
     * @brief Fire every task due at the current time
     */
    size_t runDueTimers() { return timers_.runDue(currentTime()); }

    /**
     * @brief Move the clock forward after rendering frames
     */
    void advance(unsigned int frames) {
        if (state_ == State::RUNNING) {
            framesRendered_ += frames;
        }
    }

    TimerQueue& timers() { return timers_; }
    const TimerQueue& timers() const { return timers_; }

private:
    float sampleRate_;
    uint64_t framesRendered_ = 0;
    State state_ = State::SUSPENDED;
    TimerQueue timers_;
};

} // namespace engine

#endif // AUDIO_CONTEXT_HPP
