/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/CompanionApp.hpp"
#include "core/Logger.hpp"
#include "host/SDLHotkeyService.hpp"
#include "host/SDLWindowGateway.hpp"
#include "managers/CompanionScheduler.hpp"
#include "managers/CompanionSettingsStore.hpp"
#include "managers/InteractionBridge.hpp"
#include "managers/InteractionController.hpp"
#include "managers/SettingsManager.hpp"
#include "managers/SnapshotFeed.hpp"
#include "render/SDLCompanionVisual.hpp"
#include "render/SpriteCache.hpp"

#include <cmath>
#include <format>
#include <vector>

#ifndef PETDOCK_APP_NAME
#define PETDOCK_APP_NAME "PetDock"
#endif

namespace PetDock {

namespace {
constexpr const char* APP_TITLE = "PetDock";
constexpr const char* SETTINGS_FILE = "settings.json";
// Gap kept between a docked window and the bottom of the usable area
constexpr int DOCK_MARGIN = 8;
} // namespace

CompanionApp::CompanionApp() = default;

CompanionApp::~CompanionApp() {
    clean();
}

// ---------------------------------------------------------------------------
// Startup
// ---------------------------------------------------------------------------

bool CompanionApp::init(const std::string& defaultsPath) {
    APP_INFO(std::format("Initializing {}", APP_TITLE));

    if (!initSDL()) {
        return false;
    }

    auto& settings = SettingsManager::Instance();
    if (!settings.loadFromFile(defaultsPath)) {
        APP_WARN("Failed to load " + defaultsPath + " - using built-in defaults");
    }

    // User settings live beside the logs and override the shipped defaults
    if (char* prefPath = SDL_GetPrefPath("PetDock", PETDOCK_APP_NAME)) {
        m_settingsPath = std::string(prefPath) + SETTINGS_FILE;
        SDL_free(prefPath);
        if (!settings.loadFromFile(m_settingsPath)) {
            APP_INFO("No user settings yet at " + m_settingsPath);
        }
    } else {
        APP_ERROR(std::format("SDL_GetPrefPath failed: {} - settings will not persist", SDL_GetError()));
    }

    m_config = AppConfig::load(settings);

    if (!createWindow()) {
        return false;
    }

    wireComponents();
    m_running = true;
    APP_INFO("Initialization complete");
    return true;
}

bool CompanionApp::initSDL() {
    if (!SDL_Init(SDL_INIT_VIDEO)) {
        APP_CRITICAL(std::format("SDL initialization failed: {}", SDL_GetError()));
        return false;
    }
    m_sdlInitialized = true;

    SDL_SetAppMetadata(APP_TITLE, nullptr, "com.petdock." PETDOCK_APP_NAME);
    // Window drags track the pointer outside the window
    SDL_SetHint(SDL_HINT_MOUSE_AUTO_CAPTURE, "1");
    SDL_SetHint(SDL_HINT_MOUSE_FOCUS_CLICKTHROUGH, "1");
    SDL_SetHint("SDL_VIDEO_X11_NET_WM_BYPASS_COMPOSITOR", "0");
    return true;
}

bool CompanionApp::createWindow() {
    WindowGeometry& geometry = m_config.window;

    const SDL_WindowFlags flags = SDL_WINDOW_BORDERLESS | SDL_WINDOW_TRANSPARENT |
                                  SDL_WINDOW_ALWAYS_ON_TOP | SDL_WINDOW_UTILITY;
    mp_window.reset(SDL_CreateWindow(APP_TITLE, static_cast<int>(geometry.width),
                                     static_cast<int>(geometry.height), flags));
    if (!mp_window) {
        APP_CRITICAL(std::format("Failed to create window: {}", SDL_GetError()));
        return false;
    }

    if (!m_config.hasStoredPosition) {
        // Dock centered along the bottom of the primary display
        SDL_Rect usable{};
        if (SDL_GetDisplayUsableBounds(SDL_GetPrimaryDisplay(), &usable)) {
            geometry.x = static_cast<float>(usable.x) + (static_cast<float>(usable.w) - geometry.width) / 2.0f;
            geometry.y = static_cast<float>(usable.y + usable.h - DOCK_MARGIN) - geometry.height;
        } else {
            APP_WARN(std::format("Could not query usable display bounds: {}", SDL_GetError()));
        }
    }
    if (!SDL_SetWindowPosition(mp_window.get(), static_cast<int>(std::lround(geometry.x)),
                               static_cast<int>(std::lround(geometry.y)))) {
        APP_ERROR(std::format("Failed to place window: {}", SDL_GetError()));
    }

    // Keyboard focus is what delivers the hold hotkey
    if (!SDL_RaiseWindow(mp_window.get())) {
        APP_WARN(std::format("Could not raise window: {}", SDL_GetError()));
    }

    mp_renderer.reset(SDL_CreateRenderer(mp_window.get(), nullptr));
    if (!mp_renderer) {
        APP_CRITICAL(std::format("Failed to create renderer: {}", SDL_GetError()));
        return false;
    }

    if (!SDL_SetRenderVSync(mp_renderer.get(), m_config.vsync ? 1 : 0)) {
        APP_WARN(std::format("Failed to {} VSync: {}", m_config.vsync ? "enable" : "disable", SDL_GetError()));
        m_softwareFrameLimit = true;
    } else {
        m_softwareFrameLimit = !m_config.vsync;
    }

    APP_INFO(std::format("Window {:.0f}x{:.0f} at {:.0f},{:.0f} ({} frame limiting)",
                         geometry.width, geometry.height, geometry.x, geometry.y,
                         m_softwareFrameLimit ? "software" : "hardware"));
    return true;
}

void CompanionApp::wireComponents() {
    auto& settings = SettingsManager::Instance();

    m_sprites = std::make_unique<SpriteCache>(mp_renderer.get());

    m_surface = std::make_unique<SDLSurface>(mp_window.get(), [this](float x, float y) -> std::optional<CompanionHit> {
        if (!m_scheduler) {
            return std::nullopt;
        }
        return m_scheduler->hitTest(x, y);
    });
    m_surface->setBoundsSource([this]() {
        return m_scheduler ? m_scheduler->getVisualBounds(m_surface->getHeight()) : std::vector<SDL_FRect>{};
    });

    SchedulerConfig schedulerConfig;
    schedulerConfig.initialContainerWidth = m_config.window.width;
    m_scheduler = std::make_unique<CompanionScheduler>(schedulerConfig, [this](const std::string& id) {
        return std::make_unique<SDLCompanionVisual>(*m_sprites, id, m_surface->getHeight());
    });

    m_settingsStore = std::make_unique<CompanionSettingsStore>(settings, m_settingsPath);
    m_scheduler->setSettingsGetter(m_settingsStore->makeSettingsGetter());
    m_settingsStore->bindScheduler(*m_scheduler);

    m_feed = std::make_unique<SnapshotFeed>(m_config.snapshotPath, m_config.pollIntervalMs);
    m_gateway = std::make_unique<SDLWindowGateway>(mp_window.get());
    m_hotkeys = std::make_unique<SDLHotkeyService>([window = mp_window.get()]() {
        return (SDL_GetWindowFlags(window) & SDL_WINDOW_NOT_FOCUSABLE) == 0;
    });

    InteractionConfig interactionConfig;
    interactionConfig.hotkeyCombination = m_config.hotkeyCombination;
    interactionConfig.holdDurationMs = m_config.holdDurationMs;
    interactionConfig.minWindowWidth = AppConfig::MIN_WINDOW_WIDTH;
    interactionConfig.initialGeometry = m_config.window;

    InteractionCallbacks callbacks;
    callbacks.onWindowConfigChanged = [this](const WindowGeometry& geometry) {
        onWindowConfigChanged(geometry);
    };
    callbacks.onCompanionPositionChanged = [this](const std::string& id, float x) {
        m_settingsStore->savePosition(id, x);
    };
    callbacks.onCompanionClicked = [](const std::string& id) {
        APP_INFO("Companion clicked: " + id);
    };

    m_controller = std::make_unique<InteractionController>(
        interactionConfig, *m_gateway, *m_hotkeys, *m_surface, m_timers,
        []() { return SDL_GetTicks(); }, InteractionBridge::connect(*m_scheduler), std::move(callbacks));

    updateScreenSize();
    m_controller->start();

    m_hotkeys->registerHotkey(
        m_config.pauseCombination,
        [this](HotkeyState state) {
            // One toggle per press, not per key repeat
            if (state == HotkeyState::Pressed && !m_pauseHotkeyDown) {
                m_scheduler->togglePause();
            }
            m_pauseHotkeyDown = state == HotkeyState::Pressed;
        },
        [combination = m_config.pauseCombination](bool success) {
            if (!success) {
                APP_WARN("Pause hotkey unavailable: " + combination);
            }
        });

    m_scheduler->start();
}

void CompanionApp::updateScreenSize() {
    const SDL_DisplayID display = SDL_GetDisplayForWindow(mp_window.get());
    const SDL_DisplayMode* mode = display != 0 ? SDL_GetDesktopDisplayMode(display) : nullptr;
    if (!mode) {
        APP_WARN(std::format("Could not query display mode: {}", SDL_GetError()));
        return;
    }
    m_scheduler->setScreenSize(static_cast<float>(mode->w), static_cast<float>(mode->h));
}

// ---------------------------------------------------------------------------
// Main loop
// ---------------------------------------------------------------------------

void CompanionApp::run() {
    m_lastTickNs = SDL_GetTicksNS();
    m_tickAccumulatorNs = 0;

    while (m_running) {
        const Uint64 frameStartNs = SDL_GetTicksNS();
        handleEvents();
        update();
        render();
        if (m_softwareFrameLimit) {
            limitFrame(frameStartNs);
        }
    }
}

void CompanionApp::handleEvents() {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        switch (event.type) {
        case SDL_EVENT_QUIT:
            APP_INFO("Quit requested");
            requestQuit();
            break;
        case SDL_EVENT_KEY_DOWN:
        case SDL_EVENT_KEY_UP:
            m_hotkeys->handleEvent(event);
            break;
        case SDL_EVENT_MOUSE_BUTTON_DOWN:
        case SDL_EVENT_MOUSE_BUTTON_UP:
        case SDL_EVENT_MOUSE_MOTION:
            if (auto pointer = m_surface->translateEvent(event)) {
                dispatchPointer(pointer->first, pointer->second);
            }
            break;
        default:
            if (event.type >= SDL_EVENT_WINDOW_FIRST && event.type <= SDL_EVENT_WINDOW_LAST) {
                handleWindowEvent(event);
            }
            break;
        }
    }
}

void CompanionApp::handleWindowEvent(const SDL_Event& event) {
    switch (event.type) {
    case SDL_EVENT_WINDOW_RESIZED:
        m_surface->setSize(static_cast<float>(event.window.data1), static_cast<float>(event.window.data2));
        // No-op when the controller itself requested this width
        m_controller->setWindowWidth(static_cast<float>(event.window.data1));
        break;
    case SDL_EVENT_WINDOW_DISPLAY_CHANGED:
    case SDL_EVENT_WINDOW_DISPLAY_SCALE_CHANGED:
        updateScreenSize();
        break;
    case SDL_EVENT_WINDOW_FOCUS_GAINED:
        APP_DEBUG("Keyboard focus gained - hold hotkey active");
        break;
    case SDL_EVENT_WINDOW_FOCUS_LOST:
        APP_INFO("Keyboard focus lost - click a companion to use the hold hotkey again");
        break;
    case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
        requestQuit();
        break;
    default:
        break;
    }
}

void CompanionApp::dispatchPointer(PointerPhase phase, const PointerEvent& event) {
    switch (phase) {
    case PointerPhase::Down:
        m_controller->onPointerDown(event);
        break;
    case PointerPhase::Move:
        m_controller->onPointerMove(event);
        break;
    case PointerPhase::Up:
        m_controller->onPointerUp(event);
        break;
    }
}

void CompanionApp::update() {
    const Uint64 nowMs = SDL_GetTicks();
    m_timers.update(nowMs);

    m_feed->update(nowMs, [this](const std::vector<CompanionSnapshot>& snapshot) {
        m_scheduler->reconcile(snapshot);
    });

    // Fixed 60 Hz motion regardless of the display refresh rate
    const Uint64 nowNs = SDL_GetTicksNS();
    m_tickAccumulatorNs += nowNs - m_lastTickNs;
    m_lastTickNs = nowNs;

    int steps = 0;
    while (m_tickAccumulatorNs >= FIXED_STEP_NS && steps < MAX_STEPS_PER_FRAME) {
        m_scheduler->tick(nowMs);
        m_tickAccumulatorNs -= FIXED_STEP_NS;
        ++steps;
    }
    if (steps == MAX_STEPS_PER_FRAME) {
        m_tickAccumulatorNs = 0;
    }

    m_surface->updateShape(nowMs);
}

void CompanionApp::render() {
    SDL_Renderer* renderer = mp_renderer.get();

    // Fully transparent background
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_NONE);
    SDL_SetRenderDrawColor(renderer, 0, 0, 0, 0);
    SDL_RenderClear(renderer);

    m_surface->renderAffordances(renderer);
    m_scheduler->render(renderer, m_surface->getHeight());

    if (!SDL_RenderPresent(renderer)) {
        APP_ERROR(std::format("SDL_RenderPresent failed: {}", SDL_GetError()));
    }
}

void CompanionApp::limitFrame(Uint64 frameStartNs) const {
    const Uint64 elapsedNs = SDL_GetTicksNS() - frameStartNs;
    if (elapsedNs < FIXED_STEP_NS) {
        SDL_DelayPrecise(FIXED_STEP_NS - elapsedNs);
    }
}

// ---------------------------------------------------------------------------
// Persistence
// ---------------------------------------------------------------------------

void CompanionApp::onWindowConfigChanged(const WindowGeometry& geometry) {
    m_config.window = geometry;
    AppConfig::saveWindow(SettingsManager::Instance(), geometry);
    saveSettings();
}

void CompanionApp::saveSettings() const {
    if (m_settingsPath.empty()) {
        return;
    }
    if (!SettingsManager::Instance().saveToFile(m_settingsPath)) {
        APP_ERROR("Failed to save settings to " + m_settingsPath);
    }
}

// ---------------------------------------------------------------------------
// Shutdown
// ---------------------------------------------------------------------------

void CompanionApp::clean() {
    m_running = false;

    if (m_controller) {
        m_controller->dispose();
        m_config.window = m_controller->getGeometry();
        m_controller.reset();
    }
    if (m_hotkeys && m_hotkeys->isRegistered(m_config.pauseCombination)) {
        m_hotkeys->unregisterHotkey(m_config.pauseCombination, nullptr);
    }
    m_timers.clear();

    if (m_settingsStore) {
        m_settingsStore->unbindScheduler();
    }
    if (m_scheduler) {
        m_scheduler->dispose();
        m_scheduler.reset();
    }

    if (mp_window) {
        AppConfig::saveWindow(SettingsManager::Instance(), m_config.window);
        saveSettings();
    }

    m_settingsStore.reset();
    m_feed.reset();
    m_surface.reset();
    m_hotkeys.reset();
    m_gateway.reset();
    // Textures must go before their renderer
    m_sprites.reset();
    mp_renderer.reset();
    mp_window.reset();

    if (m_sdlInitialized) {
        APP_INFO("Calling SDL_Quit...");
        SDL_Quit();
        m_sdlInitialized = false;
    }
}

} // namespace PetDock
