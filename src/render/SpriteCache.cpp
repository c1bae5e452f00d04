/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "render/SpriteCache.hpp"
#include "core/Logger.hpp"

#include <SDL3_image/SDL_image.h>
#include <cmath>
#include <format>

namespace PetDock {

int SpriteTexture::frameCount() const {
    if (width <= 0.0f || height <= 0.0f) {
        return 1;
    }
    const float frames = width / height;
    if (frames < 2.0f || frames != std::floor(frames)) {
        return 1;
    }
    return static_cast<int>(frames);
}

SpriteCache::SpriteCache(SDL_Renderer* renderer) : mp_renderer(renderer) {}

SpriteTexture SpriteCache::get(const std::string& path) {
    if (path.empty()) {
        return {};
    }

    auto it = m_textures.find(path);
    if (it != m_textures.end()) {
        return it->second;
    }
    if (m_failed.contains(path)) {
        return {};
    }

    SpriteTexture sprite = load(path);
    if (!sprite) {
        m_failed.insert(path);
        return {};
    }
    m_textures[path] = sprite;
    return sprite;
}

bool SpriteCache::contains(const std::string& path) const {
    return m_textures.contains(path);
}

void SpriteCache::clear() {
    m_textures.clear();
    m_failed.clear();
}

SpriteTexture SpriteCache::load(const std::string& path) {
    if (!mp_renderer) {
        SPRITE_ERROR("No renderer - cannot load sprite " + path);
        return {};
    }

    auto surface = std::unique_ptr<SDL_Surface, decltype(&SDL_DestroySurface)>(
        IMG_Load(path.c_str()), SDL_DestroySurface);
    if (!surface) {
        SPRITE_ERROR("Could not load image " + path + ": " + std::string(SDL_GetError()));
        return {};
    }

    auto texture = std::unique_ptr<SDL_Texture, decltype(&SDL_DestroyTexture)>(
        SDL_CreateTextureFromSurface(mp_renderer, surface.get()), SDL_DestroyTexture);
    if (!texture) {
        SPRITE_ERROR("Could not create texture for " + path + ": " + std::string(SDL_GetError()));
        return {};
    }

    // Pixel art: keep edges crisp when scaled
    SDL_SetTextureScaleMode(texture.get(), SDL_SCALEMODE_NEAREST);

    SpriteTexture sprite;
    sprite.width = static_cast<float>(surface->w);
    sprite.height = static_cast<float>(surface->h);
    sprite.texture = std::shared_ptr<SDL_Texture>(texture.release(), SDL_DestroyTexture);

    SPRITE_INFO(std::format("Loaded sprite {} ({}x{}, {} frames)", path, surface->w, surface->h,
                            sprite.frameCount()));
    return sprite;
}

} // namespace PetDock
