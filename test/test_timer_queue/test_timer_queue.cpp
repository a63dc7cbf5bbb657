#include <unity.h>
#include <timer_queue.hpp>
#include <vector>

static std::vector<int> fired;

void setUp(void) {
    fired.clear();
}

void tearDown(void) {}

void test_runDue_shouldFireInDueTimeOrder(void) {
    engine::TimerQueue timers;
    timers.schedule(0.3, []() { fired.push_back(3); });
    timers.schedule(0.1, []() { fired.push_back(1); });
    timers.schedule(0.2, []() { fired.push_back(2); });

    TEST_ASSERT_EQUAL_UINT_MESSAGE(2, timers.runDue(0.25), "Only tasks due by 0.25 fire");
    TEST_ASSERT_EQUAL_INT(2, static_cast<int>(fired.size()));
    TEST_ASSERT_EQUAL_INT(1, fired[0]);
    TEST_ASSERT_EQUAL_INT(2, fired[1]);
    TEST_ASSERT_EQUAL_UINT_MESSAGE(1, timers.pendingCount(), "Later task still pending");

    timers.runDue(1.0);
    TEST_ASSERT_EQUAL_INT(3, fired[2]);
    TEST_ASSERT_EQUAL_UINT(0, timers.pendingCount());
}

void test_equalDueTimes_shouldFireInSchedulingOrder(void) {
    engine::TimerQueue timers;
    for (int i = 0; i < 5; ++i) {
        timers.schedule(1.0, [i]() { fired.push_back(i); });
    }
    timers.runDue(1.0);

    TEST_ASSERT_EQUAL_INT(5, static_cast<int>(fired.size()));
    for (int i = 0; i < 5; ++i) {
        TEST_ASSERT_EQUAL_INT_MESSAGE(i, fired[i], "Ties fire in scheduling order");
    }
}

void test_cancel_shouldPreventFiringAndBeIdempotent(void) {
    engine::TimerQueue timers;
    engine::TimerHandle handle = timers.schedule(0.5, []() { fired.push_back(1); });

    TEST_ASSERT_TRUE(timers.isPending(handle));
    TEST_ASSERT_TRUE_MESSAGE(timers.cancel(handle), "First cancel succeeds");
    TEST_ASSERT_FALSE_MESSAGE(timers.cancel(handle), "Second cancel is a no-op");
    TEST_ASSERT_FALSE(timers.isPending(handle));

    timers.runDue(10.0);
    TEST_ASSERT_EQUAL_INT_MESSAGE(0, static_cast<int>(fired.size()), "Cancelled task never fires");
}

void test_defaultHandle_shouldNeverMatch(void) {
    engine::TimerQueue timers;
    engine::TimerHandle none;
    TEST_ASSERT_FALSE(none.isValid());
    TEST_ASSERT_FALSE(timers.isPending(none));
    TEST_ASSERT_FALSE(timers.cancel(none));
}

void test_staleHandle_shouldNotCancelReusedSlot(void) {
    engine::TimerQueue timers;
    engine::TimerHandle first = timers.schedule(0.1, []() { fired.push_back(1); });
    timers.runDue(0.1);

    // The freed slot is reused by the next task
    engine::TimerHandle second = timers.schedule(0.2, []() { fired.push_back(2); });
    TEST_ASSERT_EQUAL_UINT_MESSAGE(first.slot, second.slot, "Slot is reused");
    TEST_ASSERT_NOT_EQUAL_MESSAGE(first.generation, second.generation, "Generation differs after reuse");

    TEST_ASSERT_FALSE_MESSAGE(timers.cancel(first), "Stale handle cannot cancel the new task");
    timers.runDue(0.2);
    TEST_ASSERT_EQUAL_INT(2, static_cast<int>(fired.size()));
    TEST_ASSERT_EQUAL_INT(2, fired[1]);
}

void test_callbacks_shouldScheduleAndCancelReentrantly(void) {
    engine::TimerQueue timers;
    engine::TimerHandle victim = timers.schedule(0.3, []() { fired.push_back(99); });

    timers.schedule(0.1, [&timers, victim]() {
        fired.push_back(1);
        timers.cancel(victim);
        timers.schedule(0.05, []() { fired.push_back(2); });   // already due
        timers.schedule(0.5, []() { fired.push_back(3); });
    });

    timers.runDue(0.3);
    TEST_ASSERT_EQUAL_INT(2, static_cast<int>(fired.size()));
    TEST_ASSERT_EQUAL_INT(1, fired[0]);
    TEST_ASSERT_EQUAL_INT_MESSAGE(2, fired[1], "Task scheduled in the past fires in the same pass");
    TEST_ASSERT_EQUAL_UINT(1, timers.pendingCount());

    timers.runDue(1.0);
    TEST_ASSERT_EQUAL_INT(3, fired[2]);
}

void test_cancelAll_shouldDropEveryPendingTask(void) {
    engine::TimerQueue timers;
    for (int i = 0; i < 10; ++i) {
        timers.schedule(0.1 * i, [i]() { fired.push_back(i); });
    }
    timers.cancelAll();

    TEST_ASSERT_EQUAL_UINT(0, timers.pendingCount());
    TEST_ASSERT_TRUE_MESSAGE(timers.nextDueTime() < 0.0, "Nothing left to run");
    timers.runDue(100.0);
    TEST_ASSERT_EQUAL_INT(0, static_cast<int>(fired.size()));
}

void test_nextDueTime_shouldSkipCancelledTasks(void) {
    engine::TimerQueue timers;
    engine::TimerHandle early = timers.schedule(0.1, []() {});
    timers.schedule(0.4, []() {});
    timers.cancel(early);

    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.4f, static_cast<float>(timers.nextDueTime()));
}

int RUN_UNITY_TESTS() {
    UNITY_BEGIN();
    RUN_TEST(test_runDue_shouldFireInDueTimeOrder);
    RUN_TEST(test_equalDueTimes_shouldFireInSchedulingOrder);
    RUN_TEST(test_cancel_shouldPreventFiringAndBeIdempotent);
    RUN_TEST(test_defaultHandle_shouldNeverMatch);
    RUN_TEST(test_staleHandle_shouldNotCancelReusedSlot);
    RUN_TEST(test_callbacks_shouldScheduleAndCancelReentrantly);
    RUN_TEST(test_cancelAll_shouldDropEveryPendingTask);
    RUN_TEST(test_nextDueTime_shouldSkipCancelledTasks);
    return UNITY_END();
}

extern "C" {
#ifdef PLATFORM_NATIVE
int main(int argc, char **argv) {
    return RUN_UNITY_TESTS();
}
#endif
}
