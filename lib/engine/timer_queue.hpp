#ifndef TIMER_QUEUE_HPP
#define TIMER_QUEUE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <queue>
#include <vector>

namespace engine {

/**
 * @brief Identifies one scheduled task
 *
 * A handle stays valid after its task fires or is cancelled; it simply stops
 * matching. Slots are reused, so the generation tells a stale handle apart
 * from the task now occupying its slot.
 */
struct TimerHandle {
    uint32_t slot = INVALID_SLOT;
    uint32_t generation = 0;

    static constexpr uint32_t INVALID_SLOT = 0xFFFFFFFFu;

    bool isValid() const { return slot != INVALID_SLOT; }
};

/**
 * @brief Deferred tasks keyed on the engine clock
 *
 * Tasks fire from runDue() in due-time order, ties in scheduling order.
 * Callbacks may schedule or cancel other tasks, including themselves.
 * Tasks scheduled during runDue() with a due time already reached fire in
 * the same call.
 */
class TimerQueue {
public:
    using Callback = std::function<void()>;

    TimerQueue() = default;
    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    /**
     * @brief Schedule callback to run once the clock reaches dueTime
     */
    TimerHandle schedule(double dueTime, Callback callback);

    /**
     * @brief Cancel a pending task
     * @return true if the handle named a pending task; false for stale,
     *         fired, already cancelled, or default handles
     */
    bool cancel(const TimerHandle& handle);

    bool isPending(const TimerHandle& handle) const;

    /**
     * @brief Fire every task due at or before now
     * @return Number of tasks fired
     */
    size_t runDue(double now);

    /**
     * @brief Drop every pending task without running it
     */
    void cancelAll();

    size_t pendingCount() const { return pendingCount_; }

    /**
     * @brief Due time of the earliest pending task, or a negative value
     */
    double nextDueTime();

private:
    struct Slot {
        uint32_t generation = 0;
        bool pending = false;
        double dueTime = 0.0;
        Callback callback;
    };

    struct QueueEntry {
        double dueTime;
        uint64_t sequence;
        uint32_t slot;
        uint32_t generation;

        // Min-heap order on (dueTime, sequence)
        bool operator>(const QueueEntry& other) const {
            if (dueTime != other.dueTime) return dueTime > other.dueTime;
            return sequence > other.sequence;
        }
    };

    void releaseSlot(uint32_t index);
    void dropStaleTop();

    std::vector<Slot> slots_;
    std::vector<uint32_t> freeSlots_;
    std::priority_queue<QueueEntry, std::vector<QueueEntry>, std::greater<QueueEntry>> queue_;
    uint64_t nextSequence_ = 0;
    size_t pendingCount_ = 0;
};

} // namespace engine

#endif // TIMER_QUEUE_HPP
