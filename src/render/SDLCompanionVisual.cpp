/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "render/SDLCompanionVisual.hpp"
#include "core/Logger.hpp"

#include <cmath>
#include <numbers>

namespace PetDock {

namespace {
// #7c3aed
constexpr Uint8 PLACEHOLDER_R = 0x7c;
constexpr Uint8 PLACEHOLDER_G = 0x3a;
constexpr Uint8 PLACEHOLDER_B = 0xed;
} // namespace

SDLCompanionVisual::SDLCompanionVisual(SpriteCache& cache, std::string id, float floorY)
    : m_cache(cache), m_id(std::move(id)), m_floorY(floorY) {}

void SDLCompanionVisual::setSize(float width, float height) {
    m_width = width;
    m_height = height;
}

void SDLCompanionVisual::setWalking(bool walking) {
    if (walking && !m_walking) {
        m_walkStartMs = SDL_GetTicks();
    }
    m_walking = walking;
}

bool SDLCompanionVisual::setSprite(const std::string& spritePath) {
    m_sprite = m_cache.get(spritePath);
    if (!m_sprite) {
        SPRITE_DEBUG("Companion " + m_id + " drawn as placeholder");
        return false;
    }
    return true;
}

bool SDLCompanionVisual::containsPoint(float x, float y) const {
    const float top = m_floorY - m_height;
    return x >= m_x && x < m_x + m_width && y >= top && y < m_floorY;
}

void SDLCompanionVisual::render(SDL_Renderer* renderer, float floorY) {
    m_floorY = floorY;
    if (!renderer || m_width <= 0.0f || m_height <= 0.0f) {
        return;
    }

    const Uint64 elapsed = m_walking ? SDL_GetTicks() - m_walkStartMs : 0;
    const int frames = m_sprite ? m_sprite.frameCount() : 1;

    float lift = m_dragged ? DRAG_LIFT : 0.0f;
    if (m_walking && frames == 1) {
        const double phase = static_cast<double>(elapsed % BOB_PERIOD_MS) / BOB_PERIOD_MS;
        lift += static_cast<float>(std::fabs(std::sin(phase * std::numbers::pi))) * m_height * BOB_AMPLITUDE;
    }

    const SDL_FRect dest{m_x, floorY - m_height - lift, m_width, m_height};

    if (!m_sprite) {
        renderPlaceholder(renderer, dest);
        return;
    }

    const int frame = m_walking ? static_cast<int>((elapsed / FRAME_DURATION_MS) % static_cast<Uint64>(frames)) : 0;
    const float frameWidth = m_sprite.width / static_cast<float>(frames);
    const SDL_FRect src{frameWidth * static_cast<float>(frame), 0.0f, frameWidth, m_sprite.height};

    if (!SDL_RenderTextureRotated(renderer, m_sprite.texture.get(), &src, &dest, 0.0, nullptr,
                                  m_mirrored ? SDL_FLIP_HORIZONTAL : SDL_FLIP_NONE)) {
        SPRITE_ERROR("Failed to draw companion " + m_id + ": " + std::string(SDL_GetError()));
    }
}

void SDLCompanionVisual::renderPlaceholder(SDL_Renderer* renderer, const SDL_FRect& dest) const {
    SDL_SetRenderDrawColor(renderer, PLACEHOLDER_R, PLACEHOLDER_G, PLACEHOLDER_B, 255);
    SDL_RenderFillRect(renderer, &dest);
}

} // namespace PetDock
