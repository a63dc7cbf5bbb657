#include "timer_queue.hpp"
#include <utility>

namespace engine {

TimerHandle TimerQueue::schedule(double dueTime, Callback callback) {
    uint32_t index;
    if (!freeSlots_.empty()) {
        index = freeSlots_.back();
        freeSlots_.pop_back();
    } else {
        index = static_cast<uint32_t>(slots_.size());
        slots_.emplace_back();
    }

    Slot& slot = slots_[index];
    slot.pending = true;
    slot.dueTime = dueTime;
    slot.callback = std::move(callback);
    ++pendingCount_;

    queue_.push(QueueEntry{dueTime, nextSequence_++, index, slot.generation});
    return TimerHandle{index, slot.generation};
}

bool TimerQueue::isPending(const TimerHandle& handle) const {
    if (!handle.isValid() || handle.slot >= slots_.size()) {
        return false;
    }
    const Slot& slot = slots_[handle.slot];
    return slot.pending && slot.generation == handle.generation;
}

bool TimerQueue::cancel(const TimerHandle& handle) {
    if (!isPending(handle)) {
        return false;
    }
    // The heap entry stays behind and is skipped once its generation no longer matches
    releaseSlot(handle.slot);
    return true;
}

void TimerQueue::releaseSlot(uint32_t index) {
    Slot& slot = slots_[index];
    slot.pending = false;
    slot.callback = nullptr;
    ++slot.generation;
    --pendingCount_;
    freeSlots_.push_back(index);
}

void TimerQueue::dropStaleTop() {
    while (!queue_.empty()) {
        const QueueEntry& top = queue_.top();
        const Slot& slot = slots_[top.slot];
        if (slot.pending && slot.generation == top.generation) {
            return;
        }
        queue_.pop();
    }
}

size_t TimerQueue::runDue(double now) {
    size_t fired = 0;
    for (;;) {
        dropStaleTop();
        if (queue_.empty() || queue_.top().dueTime > now) {
            break;
        }
        uint32_t index = queue_.top().slot;
        queue_.pop();

        // Release before invoking so the callback sees itself as no longer pending
        Callback callback = std::move(slots_[index].callback);
        releaseSlot(index);
        if (callback) {
            callback();
        }
        ++fired;
    }
    return fired;
}

void TimerQueue::cancelAll() {
    for (uint32_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i].pending) {
            releaseSlot(i);
        }
    }
    while (!queue_.empty()) {
        queue_.pop();
    }
}

double TimerQueue::nextDueTime() {
    dropStaleTop();
    return queue_.empty() ? -1.0 : queue_.top().dueTime;
}

} // namespace engine
