/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ICOMPANION_VISUAL_HPP
#define ICOMPANION_VISUAL_HPP

#include <string>

struct SDL_Renderer;

namespace PetDock {

/**
 * @brief Opaque positionable visual object for one companion
 *
 * The scheduler only places, sizes and orients it. During an entity drag the
 * interaction controller moves it directly; the scheduler reads the position
 * back when the drag is committed.
 */
class ICompanionVisual {
public:
    virtual ~ICompanionVisual() = default;

    // Surface-local horizontal offset of the left edge
    virtual void setPosition(float x) = 0;
    [[nodiscard]] virtual float getPosition() const = 0;

    virtual void setSize(float width, float height) = 0;

    /**
     * @brief Width as currently rendered
     * @return Width in surface units, or 0 if not laid out yet
     */
    [[nodiscard]] virtual float getRenderedWidth() const = 0;

    virtual void setMirrored(bool mirrored) = 0;

    // Walking animation on/off (playback only, never moves the visual)
    virtual void setWalking(bool walking) = 0;

    /**
     * @brief Points the visual at a new sprite asset
     * @return false if the asset could not be loaded and a flat placeholder
     *         is shown instead
     */
    virtual bool setSprite(const std::string& spritePath) = 0;

    /**
     * @brief Marks the visual as held by an entity drag
     *
     * While held, the scheduler leaves both the visual and the committed
     * state alone; the drag owns the on-screen position until release.
     */
    virtual void setDragged(bool dragged) = 0;
    [[nodiscard]] virtual bool isDragged() const = 0;

    [[nodiscard]] virtual bool containsPoint(float x, float y) const = 0;

    /**
     * @brief Draws the visual standing on floorY
     */
    virtual void render(SDL_Renderer* renderer, float floorY) = 0;
};

} // namespace PetDock

#endif // ICOMPANION_VISUAL_HPP
