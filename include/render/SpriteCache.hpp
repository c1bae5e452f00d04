/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPRITE_CACHE_HPP
#define SPRITE_CACHE_HPP

#include <SDL3/SDL.h>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace PetDock {

/**
 * @brief Texture with cached dimensions to avoid per-frame SDL_GetTextureSize() calls
 */
struct SpriteTexture {
    std::shared_ptr<SDL_Texture> texture;
    float width{0.0f};
    float height{0.0f};

    [[nodiscard]] explicit operator bool() const { return texture != nullptr; }

    /**
     * @brief Number of square frames laid out horizontally
     *
     * A 256x64 sheet is four 64x64 frames; anything that is not a whole
     * multiple of its height is a single frame.
     */
    [[nodiscard]] int frameCount() const;
};

/**
 * @brief Loads companion sprites through SDL3_image and caches them by path
 *
 * Several companions sharing one sprite share one texture. Failed loads are
 * logged once and retried only after clear().
 */
class SpriteCache {
public:
    explicit SpriteCache(SDL_Renderer* renderer);
    ~SpriteCache() = default;

    SpriteCache(const SpriteCache&) = delete;
    SpriteCache& operator=(const SpriteCache&) = delete;

    /**
     * @brief Returns the texture for a path, loading it on first use
     * @return Empty SpriteTexture if the file could not be loaded
     */
    SpriteTexture get(const std::string& path);

    [[nodiscard]] bool contains(const std::string& path) const;
    [[nodiscard]] size_t size() const { return m_textures.size(); }

    void clear();

private:
    SpriteTexture load(const std::string& path);

    SDL_Renderer* mp_renderer;
    std::unordered_map<std::string, SpriteTexture> m_textures;
    std::unordered_set<std::string> m_failed;
};

} // namespace PetDock

#endif // SPRITE_CACHE_HPP
