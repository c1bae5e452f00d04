/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SDL_WINDOW_GATEWAY_HPP
#define SDL_WINDOW_GATEWAY_HPP

#include "host/IGeometryGateway.hpp"

#include <SDL3/SDL.h>

namespace PetDock {

/**
 * @brief IGeometryGateway over an SDL_Window
 *
 * SDL window calls are synchronous, so every completion runs inline.
 * Logical units are SDL window coordinates; physical pixels are those
 * multiplied by the display content scale.
 */
class SDLWindowGateway : public IGeometryGateway {
public:
    explicit SDLWindowGateway(SDL_Window* window) : mp_window(window) {}
    ~SDLWindowGateway() override = default;

    void getPosition(PositionCallback done) override;
    void setPosition(float x, float y, CompletionCallback done) override;
    void setSize(float width, float height, CompletionCallback done) override;
    void getScaleFactor(ScaleCallback done) override;

private:
    [[nodiscard]] float displayScale() const;

    SDL_Window* mp_window;
};

} // namespace PetDock

#endif // SDL_WINDOW_GATEWAY_HPP
