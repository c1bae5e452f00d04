/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/FrameTimerQueue.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>

namespace PetDock {

TimerHandle FrameTimerQueue::schedule(Uint64 delayMs, Callback callback, Uint64 nowMs) {
    if (!callback) {
        TIMER_WARN("Ignoring schedule() with an empty callback");
        return INVALID_TIMER;
    }

    Timer timer;
    timer.handle = m_nextHandle++;
    timer.deadline = nowMs + delayMs;
    timer.callback = std::move(callback);

    // upper_bound keeps equal deadlines in scheduling order
    auto pos = std::upper_bound(m_timers.begin(), m_timers.end(), timer.deadline,
        [](Uint64 deadline, const Timer& t) { return deadline < t.deadline; });
    const TimerHandle handle = timer.handle;
    m_timers.insert(pos, std::move(timer));

    TIMER_DEBUG(std::format("Scheduled timer {} for +{}ms", handle, delayMs));
    return handle;
}

bool FrameTimerQueue::cancel(TimerHandle handle) {
    if (handle == INVALID_TIMER) {
        return false;
    }

    auto it = std::find_if(m_timers.begin(), m_timers.end(),
                           [handle](const Timer& t) { return t.handle == handle; });
    if (it == m_timers.end()) {
        return false;
    }

    m_timers.erase(it);
    TIMER_DEBUG(std::format("Cancelled timer {}", handle));
    return true;
}

void FrameTimerQueue::update(Uint64 nowMs) {
    // Anything scheduled while firing gets a handle >= this and waits a frame
    const TimerHandle firstNewHandle = m_nextHandle;

    while (true) {
        auto due = std::find_if(m_timers.begin(), m_timers.end(),
            [nowMs, firstNewHandle](const Timer& t) {
                return t.deadline <= nowMs && t.handle < firstNewHandle;
            });
        if (due == m_timers.end() || due->deadline > nowMs) {
            break;
        }

        // Remove before running so the callback can cancel/schedule freely
        Callback callback = std::move(due->callback);
        m_timers.erase(due);
        callback();
    }
}

bool FrameTimerQueue::isPending(TimerHandle handle) const {
    return std::any_of(m_timers.begin(), m_timers.end(),
                       [handle](const Timer& t) { return t.handle == handle; });
}

void FrameTimerQueue::clear() {
    m_timers.clear();
}

} // namespace PetDock
