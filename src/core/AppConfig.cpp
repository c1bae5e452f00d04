/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/AppConfig.hpp"
#include "managers/SettingsManager.hpp"

#include <algorithm>
#include <cmath>

namespace PetDock {

namespace {
constexpr int MIN_HOLD_MS = 50;
constexpr int MIN_POLL_INTERVAL_MS = 250;
} // namespace

AppConfig AppConfig::load(const SettingsManager& settings) {
    AppConfig config;

    config.hasStoredPosition = settings.has("window", "x") && settings.has("window", "y");
    config.window.x = settings.get<float>("window", "x", 0.0f);
    config.window.y = std::max(0.0f, settings.get<float>("window", "y", 0.0f));
    config.window.width = std::max(MIN_WINDOW_WIDTH,
                                   settings.get<float>("window", "width", DEFAULT_WINDOW_WIDTH));
    const float height = settings.get<float>("window", "height", DEFAULT_WINDOW_HEIGHT);
    config.window.height = height > 0.0f ? height : DEFAULT_WINDOW_HEIGHT;

    config.hotkeyCombination = settings.get<std::string>("hotkey", "combination", config.hotkeyCombination);
    config.pauseCombination = settings.get<std::string>("hotkey", "pause_combination", config.pauseCombination);
    config.holdDurationMs = static_cast<Uint64>(
        std::max(MIN_HOLD_MS, settings.get<int>("hotkey", "hold_ms", static_cast<int>(config.holdDurationMs))));

    config.snapshotPath = settings.get<std::string>("server", "snapshot_path", config.snapshotPath);
    config.pollIntervalMs = static_cast<Uint64>(std::max(
        MIN_POLL_INTERVAL_MS,
        settings.get<int>("server", "poll_interval_ms", static_cast<int>(config.pollIntervalMs))));

    config.vsync = settings.get<bool>("graphics", "vsync", config.vsync);
    return config;
}

void AppConfig::saveWindow(SettingsManager& settings, const WindowGeometry& geometry) {
    settings.set("window", "x", static_cast<int>(std::lround(geometry.x)));
    settings.set("window", "y", static_cast<int>(std::lround(geometry.y)));
    settings.set("window", "width", static_cast<int>(std::lround(geometry.width)));
    settings.set("window", "height", static_cast<int>(std::lround(geometry.height)));
}

} // namespace PetDock
