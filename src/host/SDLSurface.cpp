/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "host/SDLSurface.hpp"
#include "core/Logger.hpp"

#include <string>
#include <utility>

namespace PetDock {

SDLSurface::SDLSurface(SDL_Window* window, HitTester hitTester)
    : mp_window(window), m_hitTester(std::move(hitTester)) {
    if (mp_window) {
        int w = 0;
        int h = 0;
        if (SDL_GetWindowSize(mp_window, &w, &h)) {
            setSize(static_cast<float>(w), static_cast<float>(h));
        }
    }
}

bool SDLSurface::setPointerPassThrough(bool passThrough) {
    m_passThrough = passThrough;
    if (passThrough) {
        return applyPassThroughShape();
    }

    m_inputRegion = InputRegion::Full;
    if (!mp_window) {
        return true;
    }
    if (!SDL_SetWindowShape(mp_window, nullptr)) {
        SURFACE_ERROR("Failed to restore the window shape: " + std::string(SDL_GetError()));
        return false;
    }
    if (!SDL_RaiseWindow(mp_window)) {
        SURFACE_WARN("SDL_RaiseWindow failed: " + std::string(SDL_GetError()));
    }
    return true;
}

void SDLSurface::updateShape(Uint64 nowMs) {
    if (!m_passThrough || nowMs - m_lastShapeMs < SHAPE_REFRESH_MS) {
        return;
    }
    m_lastShapeMs = nowMs;
    if (!applyPassThroughShape()) {
        SURFACE_WARN("Pass-through shape not refreshed");
    }
}

bool SDLSurface::applyPassThroughShape() {
    m_inputRegion = InputRegion::Companions;
    if (!mp_window) {
        return true;
    }

    const std::vector<SDL_FRect> bounds = m_boundsSource ? m_boundsSource() : std::vector<SDL_FRect>{};
    SurfacePtr mask = buildShapeMask(static_cast<int>(m_width), static_cast<int>(m_height), bounds);
    if (!mask) {
        SURFACE_ERROR("Cannot build pass-through shape: " + std::string(SDL_GetError()));
        return false;
    }
    // SDL keeps its own copy of the shape
    if (!SDL_SetWindowShape(mp_window, mask.get())) {
        SURFACE_ERROR("SDL_SetWindowShape failed: " + std::string(SDL_GetError()));
        return false;
    }
    return true;
}

SurfacePtr SDLSurface::buildShapeMask(int width, int height, const std::vector<SDL_FRect>& opaque) {
    if (width <= 0 || height <= 0) {
        return nullptr;
    }

    SurfacePtr mask(SDL_CreateSurface(width, height, SDL_PIXELFORMAT_ARGB8888));
    if (!mask || !SDL_ClearSurface(mask.get(), 0.0f, 0.0f, 0.0f, 0.0f)) {
        return nullptr;
    }

    std::vector<SDL_Rect> rects;
    rects.reserve(opaque.size());
    for (const SDL_FRect& area : opaque) {
        rects.push_back(SDL_Rect{static_cast<int>(area.x - SHAPE_PADDING),
                                 static_cast<int>(area.y - SHAPE_PADDING),
                                 static_cast<int>(area.w + 2.0f * SHAPE_PADDING),
                                 static_cast<int>(area.h + 2.0f * SHAPE_PADDING)});
    }
    if (!rects.empty()) {
        const Uint32 solid = SDL_MapSurfaceRGBA(mask.get(), 255, 255, 255, 255);
        if (!SDL_FillSurfaceRects(mask.get(), rects.data(), static_cast<int>(rects.size()), solid)) {
            return nullptr;
        }
    }
    return mask;
}

void SDLSurface::setPointerListening(bool listening) {
    m_listening = listening;
    if (!listening) {
        m_buttonDown = false;
    }
}

void SDLSurface::setSize(float width, float height) {
    m_width = width;
    m_height = height;
}

std::optional<std::pair<PointerPhase, PointerEvent>> SDLSurface::translateEvent(const SDL_Event& event) {
    if (!m_listening || m_passThrough) {
        return std::nullopt;
    }

    PointerPhase phase = PointerPhase::Move;
    float x = 0.0f;
    float y = 0.0f;
    switch (event.type) {
    case SDL_EVENT_MOUSE_BUTTON_DOWN:
        if (event.button.button != SDL_BUTTON_LEFT) {
            return std::nullopt;
        }
        phase = PointerPhase::Down;
        m_buttonDown = true;
        x = event.button.x;
        y = event.button.y;
        break;
    case SDL_EVENT_MOUSE_BUTTON_UP:
        if (event.button.button != SDL_BUTTON_LEFT || !m_buttonDown) {
            return std::nullopt;
        }
        phase = PointerPhase::Up;
        m_buttonDown = false;
        x = event.button.x;
        y = event.button.y;
        break;
    case SDL_EVENT_MOUSE_MOTION:
        if (!m_buttonDown) {
            return std::nullopt;
        }
        phase = PointerPhase::Move;
        x = event.motion.x;
        y = event.motion.y;
        break;
    default:
        return std::nullopt;
    }

    // Global coordinates stay stable while the window moves under the pointer
    float screenX = 0.0f;
    float screenY = 0.0f;
    SDL_GetGlobalMouseState(&screenX, &screenY);
    const bool modifierHeld = (SDL_GetModState() & SDL_KMOD_SHIFT) != 0;

    return std::make_pair(phase, resolve(x, y, screenX, screenY, modifierHeld));
}

PointerEvent SDLSurface::resolve(float x, float y, float screenX, float screenY,
                                 bool modifierHeld) const {
    PointerEvent result;
    result.x = x;
    result.y = y;
    result.screenX = screenX;
    result.screenY = screenY;
    result.modifierHeld = modifierHeld;

    if (m_affordancesVisible && m_width > 0.0f) {
        if (x < HANDLE_WIDTH) {
            result.target = PointerTarget::ResizeHandle;
            result.handleEdge = ResizeEdge::Left;
            return result;
        }
        if (x >= m_width - HANDLE_WIDTH) {
            result.target = PointerTarget::ResizeHandle;
            result.handleEdge = ResizeEdge::Right;
            return result;
        }
    }

    if (m_hitTester) {
        if (auto hit = m_hitTester(x, y)) {
            result.target = PointerTarget::Companion;
            result.companionId = hit->id;
            result.companionVisual = hit->visual;
        }
    }
    return result;
}

void SDLSurface::renderAffordances(SDL_Renderer* renderer) const {
    if (!m_affordancesVisible || !renderer || m_width <= 0.0f || m_height <= 0.0f) {
        return;
    }

    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);

    // Border
    SDL_SetRenderDrawColor(renderer, 0x7c, 0x3a, 0xed, 200);
    const SDL_FRect edges[4] = {
        {0.0f, 0.0f, m_width, BORDER_THICKNESS},
        {0.0f, m_height - BORDER_THICKNESS, m_width, BORDER_THICKNESS},
        {0.0f, 0.0f, BORDER_THICKNESS, m_height},
        {m_width - BORDER_THICKNESS, 0.0f, BORDER_THICKNESS, m_height},
    };
    SDL_RenderFillRects(renderer, edges, 4);

    // Resize handles
    SDL_SetRenderDrawColor(renderer, 0x7c, 0x3a, 0xed, 90);
    const SDL_FRect handles[2] = {
        {0.0f, 0.0f, HANDLE_WIDTH, m_height},
        {m_width - HANDLE_WIDTH, 0.0f, HANDLE_WIDTH, m_height},
    };
    SDL_RenderFillRects(renderer, handles, 2);
}

} // namespace PetDock
