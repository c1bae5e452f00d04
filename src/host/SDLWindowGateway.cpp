/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "host/SDLWindowGateway.hpp"
#include "core/Logger.hpp"

#include <cmath>
#include <format>

namespace PetDock {

float SDLWindowGateway::displayScale() const {
    // 0 when SDL cannot tell
    return SDL_GetWindowDisplayScale(mp_window);
}

void SDLWindowGateway::getPosition(PositionCallback done) {
    int x = 0;
    int y = 0;
    if (!mp_window || !SDL_GetWindowPosition(mp_window, &x, &y)) {
        GEOMETRY_ERROR("SDL_GetWindowPosition failed: " + std::string(SDL_GetError()));
        done(std::nullopt);
        return;
    }

    float scale = displayScale();
    if (scale <= 0.0f) {
        scale = 1.0f;
    }
    done(WindowPosition{static_cast<float>(x) * scale, static_cast<float>(y) * scale});
}

void SDLWindowGateway::setPosition(float x, float y, CompletionCallback done) {
    const bool ok = mp_window != nullptr &&
                    SDL_SetWindowPosition(mp_window, static_cast<int>(std::lround(x)),
                                          static_cast<int>(std::lround(y)));
    if (!ok) {
        GEOMETRY_ERROR(std::format("SDL_SetWindowPosition({:.0f}, {:.0f}) failed: {}", x, y, SDL_GetError()));
    }
    done(ok);
}

void SDLWindowGateway::setSize(float width, float height, CompletionCallback done) {
    const bool ok = mp_window != nullptr &&
                    SDL_SetWindowSize(mp_window, static_cast<int>(std::lround(width)),
                                      static_cast<int>(std::lround(height)));
    if (!ok) {
        GEOMETRY_ERROR(std::format("SDL_SetWindowSize({:.0f}, {:.0f}) failed: {}", width, height, SDL_GetError()));
    }
    done(ok);
}

void SDLWindowGateway::getScaleFactor(ScaleCallback done) {
    if (!mp_window) {
        done(std::nullopt);
        return;
    }
    const float scale = displayScale();
    if (scale <= 0.0f) {
        GEOMETRY_WARN("SDL_GetWindowDisplayScale failed: " + std::string(SDL_GetError()));
        done(std::nullopt);
        return;
    }
    done(scale);
}

} // namespace PetDock
