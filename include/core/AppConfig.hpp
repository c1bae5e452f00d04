/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef APP_CONFIG_HPP
#define APP_CONFIG_HPP

#include "host/IGeometryGateway.hpp"

#include <SDL3/SDL_stdinc.h>
#include <string>

namespace PetDock {

class SettingsManager;

/**
 * @brief Program-wide settings read once at startup
 *
 * Every value falls back to its default when the key is missing or has the
 * wrong type; out-of-range values are clamped.
 */
struct AppConfig {
    static constexpr float MIN_WINDOW_WIDTH = 400.0f;
    static constexpr float DEFAULT_WINDOW_WIDTH = 800.0f;
    static constexpr float DEFAULT_WINDOW_HEIGHT = 200.0f;

    // No stored position: the shell docks the window to the bottom of the display
    bool hasStoredPosition{false};
    WindowGeometry window{0.0f, 0.0f, DEFAULT_WINDOW_WIDTH, DEFAULT_WINDOW_HEIGHT};

    std::string hotkeyCombination{"CommandOrControl+O"};
    std::string pauseCombination{"CommandOrControl+Shift+P"};
    Uint64 holdDurationMs{500};

    std::string snapshotPath{"res/companions.json"};
    Uint64 pollIntervalMs{5000};

    bool vsync{true};

    static AppConfig load(const SettingsManager& settings);

    /**
     * @brief Stores the window geometry under the "window" category
     */
    static void saveWindow(SettingsManager& settings, const WindowGeometry& geometry);
};

} // namespace PetDock

#endif // APP_CONFIG_HPP
