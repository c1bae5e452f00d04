/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FRAME_TIMER_QUEUE_HPP
#define FRAME_TIMER_QUEUE_HPP

/**
 * @file FrameTimerQueue.hpp
 * @brief Single-threaded one-shot timers polled from the main loop
 *
 * Timers never fire on another thread. The owner calls update(nowMs) once
 * per frame and every due callback runs inline, in deadline order, on the
 * same thread that handles input and the animation tick.
 *
 * Usage:
 *   FrameTimerQueue timers;
 *   TimerHandle h = timers.schedule(500, [] { ... }, SDL_GetTicks());
 *   timers.cancel(h);           // before it fires: callback never runs
 *   timers.update(SDL_GetTicks());
 */

#include <SDL3/SDL_stdinc.h>
#include <cstdint>
#include <functional>
#include <vector>

namespace PetDock {

using TimerHandle = uint64_t;

/**
 * @brief Null value for TimerHandle. Never returned by schedule().
 */
inline constexpr TimerHandle INVALID_TIMER = 0;

class FrameTimerQueue {
public:
    using Callback = std::function<void()>;

    FrameTimerQueue() = default;
    ~FrameTimerQueue() = default;

    FrameTimerQueue(const FrameTimerQueue&) = delete;
    FrameTimerQueue& operator=(const FrameTimerQueue&) = delete;

    /**
     * @brief Schedules a one-shot callback
     * @param delayMs Delay relative to nowMs
     * @param callback Function to run once the deadline is reached
     * @param nowMs Current time in milliseconds
     * @return Handle that can be passed to cancel()
     */
    [[nodiscard]] TimerHandle schedule(Uint64 delayMs, Callback callback, Uint64 nowMs);

    /**
     * @brief Cancels a pending timer
     * @return true if the timer was pending and is now removed
     * @note Unknown, expired or INVALID_TIMER handles are ignored
     */
    bool cancel(TimerHandle handle);

    /**
     * @brief Fires every timer whose deadline is <= nowMs
     *
     * Callbacks may schedule or cancel timers. Timers scheduled from inside a
     * callback are not fired in the same update() even if already due.
     */
    void update(Uint64 nowMs);

    [[nodiscard]] bool isPending(TimerHandle handle) const;
    [[nodiscard]] size_t pendingCount() const { return m_timers.size(); }

    /**
     * @brief Drops every pending timer without running it
     */
    void clear();

private:
    struct Timer {
        TimerHandle handle{INVALID_TIMER};
        Uint64 deadline{0};
        Callback callback;
    };

    // Kept sorted by deadline, then by handle (insertion order)
    std::vector<Timer> m_timers;
    TimerHandle m_nextHandle{1};
};

} // namespace PetDock

#endif // FRAME_TIMER_QUEUE_HPP
