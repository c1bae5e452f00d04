/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMPANION_APP_HPP
#define COMPANION_APP_HPP

/**
 * @file CompanionApp.hpp
 * @brief Composition root: SDL window, collaborators and the main loop
 *
 * Everything runs on the main thread. One frame:
 *   events -> timers -> snapshot poll -> fixed-step scheduler ticks -> render
 */

#include "core/AppConfig.hpp"
#include "core/FrameTimerQueue.hpp"
#include "host/IGeometryGateway.hpp"
#include "host/SDLSurface.hpp"

#include <SDL3/SDL.h>
#include <memory>
#include <string>

namespace PetDock {

class CompanionScheduler;
class CompanionSettingsStore;
class InteractionController;
class SDLHotkeyService;
class SDLWindowGateway;
class SnapshotFeed;
class SpriteCache;

class CompanionApp {
public:
    // Scheduler motion is specified per 60 Hz frame
    static constexpr Uint64 FIXED_STEP_NS = 1'000'000'000ULL / 60;
    // Cap on catch-up ticks after a stall (window drag, breakpoint)
    static constexpr int MAX_STEPS_PER_FRAME = 5;

    CompanionApp();
    ~CompanionApp();

    CompanionApp(const CompanionApp&) = delete;
    CompanionApp& operator=(const CompanionApp&) = delete;

    /**
     * @brief Loads settings, creates the window and wires every component
     * @param defaultsPath Shipped defaults, read first
     * @return false if SDL or the window could not be brought up
     */
    bool init(const std::string& defaultsPath);

    /**
     * @brief Runs until quit is requested
     */
    void run();

    void requestQuit() { m_running = false; }

    /**
     * @brief Releases the hotkey, companions, settings and SDL objects
     * @note Safe to call more than once, including after a failed init()
     */
    void clean();

private:
    bool initSDL();
    bool createWindow();
    void wireComponents();
    void updateScreenSize();

    void handleEvents();
    void handleWindowEvent(const SDL_Event& event);
    void dispatchPointer(PointerPhase phase, const PointerEvent& event);
    void update();
    void render();
    void limitFrame(Uint64 frameStartNs) const;

    void onWindowConfigChanged(const WindowGeometry& geometry);
    void saveSettings() const;

    AppConfig m_config;
    std::string m_settingsPath;

    std::unique_ptr<SDL_Window, decltype(&SDL_DestroyWindow)> mp_window{nullptr, SDL_DestroyWindow};
    std::unique_ptr<SDL_Renderer, decltype(&SDL_DestroyRenderer)> mp_renderer{nullptr, SDL_DestroyRenderer};

    FrameTimerQueue m_timers;
    std::unique_ptr<SpriteCache> m_sprites;
    std::unique_ptr<CompanionScheduler> m_scheduler;
    std::unique_ptr<CompanionSettingsStore> m_settingsStore;
    std::unique_ptr<SnapshotFeed> m_feed;
    std::unique_ptr<SDLWindowGateway> m_gateway;
    std::unique_ptr<SDLHotkeyService> m_hotkeys;
    std::unique_ptr<SDLSurface> m_surface;
    std::unique_ptr<InteractionController> m_controller;

    Uint64 m_lastTickNs{0};
    Uint64 m_tickAccumulatorNs{0};
    bool m_running{false};
    bool m_sdlInitialized{false};
    bool m_softwareFrameLimit{false};
    bool m_pauseHotkeyDown{false};
};

} // namespace PetDock

#endif // COMPANION_APP_HPP
