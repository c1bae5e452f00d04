/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE FrameTimerQueueTests
#include <boost/test/unit_test.hpp>

#include "core/FrameTimerQueue.hpp"
#include "core/Logger.hpp"

#include <vector>

using namespace PetDock;

struct QuietLogsFixture {
    QuietLogsFixture() { PETDOCK_ENABLE_QUIET_MODE(); }
    ~QuietLogsFixture() { PETDOCK_DISABLE_QUIET_MODE(); }
};

BOOST_GLOBAL_FIXTURE(QuietLogsFixture);

BOOST_AUTO_TEST_SUITE(FrameTimerQueueTestSuite)

BOOST_AUTO_TEST_CASE(TestFiresAtDeadline) {
    FrameTimerQueue timers;
    int fired = 0;
    TimerHandle handle = timers.schedule(500, [&fired]() { ++fired; }, 1000);

    BOOST_CHECK_NE(handle, INVALID_TIMER);
    BOOST_CHECK(timers.isPending(handle));

    timers.update(1499);
    BOOST_CHECK_EQUAL(fired, 0);

    timers.update(1500);
    BOOST_CHECK_EQUAL(fired, 1);
    BOOST_CHECK(!timers.isPending(handle));

    // One-shot
    timers.update(5000);
    BOOST_CHECK_EQUAL(fired, 1);
}

BOOST_AUTO_TEST_CASE(TestCancelBeforeFiring) {
    FrameTimerQueue timers;
    int fired = 0;
    TimerHandle handle = timers.schedule(100, [&fired]() { ++fired; }, 0);

    BOOST_CHECK(timers.cancel(handle));
    BOOST_CHECK(!timers.cancel(handle));
    BOOST_CHECK(!timers.cancel(INVALID_TIMER));

    timers.update(1000);
    BOOST_CHECK_EQUAL(fired, 0);
    BOOST_CHECK_EQUAL(timers.pendingCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestDeadlineOrder) {
    FrameTimerQueue timers;
    std::vector<int> order;
    (void)timers.schedule(300, [&order]() { order.push_back(3); }, 0);
    (void)timers.schedule(100, [&order]() { order.push_back(1); }, 0);
    (void)timers.schedule(200, [&order]() { order.push_back(2); }, 0);
    (void)timers.schedule(200, [&order]() { order.push_back(22); }, 0);

    timers.update(1000);

    const std::vector<int> expected{1, 2, 22, 3};
    BOOST_CHECK_EQUAL_COLLECTIONS(order.begin(), order.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(TestCallbackMayCancelOther) {
    FrameTimerQueue timers;
    int secondFired = 0;
    TimerHandle second = timers.schedule(200, [&secondFired]() { ++secondFired; }, 0);
    (void)timers.schedule(100, [&timers, second]() { timers.cancel(second); }, 0);

    timers.update(1000);
    BOOST_CHECK_EQUAL(secondFired, 0);
}

BOOST_AUTO_TEST_CASE(TestTimerScheduledInCallbackWaitsForNextUpdate) {
    FrameTimerQueue timers;
    int inner = 0;
    (void)timers.schedule(0, [&]() {
        (void)timers.schedule(0, [&inner]() { ++inner; }, 0);
    }, 0);

    timers.update(10);
    BOOST_CHECK_EQUAL(inner, 0);
    BOOST_CHECK_EQUAL(timers.pendingCount(), 1u);

    timers.update(10);
    BOOST_CHECK_EQUAL(inner, 1);
}

BOOST_AUTO_TEST_CASE(TestEmptyCallbackRejected) {
    FrameTimerQueue timers;
    BOOST_CHECK_EQUAL(timers.schedule(10, FrameTimerQueue::Callback{}, 0), INVALID_TIMER);
    BOOST_CHECK_EQUAL(timers.pendingCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestClearDropsEverything) {
    FrameTimerQueue timers;
    int fired = 0;
    (void)timers.schedule(10, [&fired]() { ++fired; }, 0);
    (void)timers.schedule(20, [&fired]() { ++fired; }, 0);

    timers.clear();
    timers.update(100);

    BOOST_CHECK_EQUAL(fired, 0);
    BOOST_CHECK_EQUAL(timers.pendingCount(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()
