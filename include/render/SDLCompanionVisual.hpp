/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SDL_COMPANION_VISUAL_HPP
#define SDL_COMPANION_VISUAL_HPP

#include "render/ICompanionVisual.hpp"
#include "render/SpriteCache.hpp"

#include <SDL3/SDL.h>
#include <string>

namespace PetDock {

/**
 * @brief ICompanionVisual drawn with the SDL renderer
 *
 * Horizontal sprite sheets cycle their frames while walking; single-frame
 * sprites bob instead. Without a sprite a flat #7c3aed block is drawn.
 */
class SDLCompanionVisual : public ICompanionVisual {
public:
    static constexpr Uint64 FRAME_DURATION_MS = 150;
    static constexpr Uint64 BOB_PERIOD_MS = 400;
    static constexpr float BOB_AMPLITUDE = 0.04f; // fraction of height
    static constexpr float DRAG_LIFT = 4.0f;

    SDLCompanionVisual(SpriteCache& cache, std::string id, float floorY);
    ~SDLCompanionVisual() override = default;

    void setPosition(float x) override { m_x = x; }
    float getPosition() const override { return m_x; }
    void setSize(float width, float height) override;
    float getRenderedWidth() const override { return m_width; }
    void setMirrored(bool mirrored) override { m_mirrored = mirrored; }
    void setWalking(bool walking) override;
    bool setSprite(const std::string& spritePath) override;
    void setDragged(bool dragged) override { m_dragged = dragged; }
    bool isDragged() const override { return m_dragged; }
    bool containsPoint(float x, float y) const override;
    void render(SDL_Renderer* renderer, float floorY) override;

    [[nodiscard]] bool isWalking() const { return m_walking; }
    [[nodiscard]] bool isMirrored() const { return m_mirrored; }
    [[nodiscard]] bool hasSprite() const { return static_cast<bool>(m_sprite); }

private:
    void renderPlaceholder(SDL_Renderer* renderer, const SDL_FRect& dest) const;

    SpriteCache& m_cache;
    std::string m_id;
    SpriteTexture m_sprite;

    float m_x{0.0f};
    float m_width{0.0f};
    float m_height{0.0f};
    float m_floorY{0.0f};
    bool m_mirrored{false};
    bool m_walking{false};
    bool m_dragged{false};
    Uint64 m_walkStartMs{0};
};

} // namespace PetDock

#endif // SDL_COMPANION_VISUAL_HPP
