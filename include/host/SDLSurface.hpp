/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SDL_SURFACE_HPP
#define SDL_SURFACE_HPP

#include "host/ISurface.hpp"
#include "managers/CompanionScheduler.hpp"

#include <SDL3/SDL.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace PetDock {

enum class PointerPhase : uint8_t { Down, Move, Up };

// Which part of the window takes pointer input
enum class InputRegion : uint8_t { Full, Companions };

struct SurfaceDeleter {
    void operator()(SDL_Surface* surface) const { SDL_DestroySurface(surface); }
};
using SurfacePtr = std::unique_ptr<SDL_Surface, SurfaceDeleter>;

/**
 * @brief ISurface for the borderless SDL window
 *
 * Pass-through shapes the transparent window down to the companions'
 * sprites, so clicks anywhere else reach the desktop beneath, and stops
 * pointer delivery. The shape follows the companions as they walk. In
 * interactive mode the full rectangle takes input again; the surface draws
 * a border and two edge handles and turns SDL mouse events into
 * PointerEvents already resolved against the handles and the companions
 * under the pointer.
 */
class SDLSurface : public ISurface {
public:
    using HitTester = std::function<std::optional<CompanionHit>(float x, float y)>;
    using BoundsSource = std::function<std::vector<SDL_FRect>()>;

    static constexpr float HANDLE_WIDTH = 8.0f;
    static constexpr float BORDER_THICKNESS = 2.0f;
    // Slack around each sprite so a walking companion stays inside its shape between refreshes
    static constexpr float SHAPE_PADDING = 16.0f;
    static constexpr Uint64 SHAPE_REFRESH_MS = 100;

    SDLSurface(SDL_Window* window, HitTester hitTester);
    ~SDLSurface() override = default;

    bool setPointerPassThrough(bool passThrough) override;
    void setAffordancesVisible(bool visible) override { m_affordancesVisible = visible; }
    void setPointerListening(bool listening) override;

    /**
     * @brief Supplies the companion rectangles the pass-through shape keeps
     */
    void setBoundsSource(BoundsSource source) { m_boundsSource = std::move(source); }

    /**
     * @brief Re-applies the pass-through shape at most every SHAPE_REFRESH_MS
     *
     * Does nothing outside pass-through.
     */
    void updateShape(Uint64 nowMs);

    /**
     * @brief Builds a window shape that is opaque only inside the padded rectangles
     * @return nullptr if the size is empty or SDL could not allocate the surface
     */
    [[nodiscard]] static SurfacePtr buildShapeMask(int width, int height,
                                                   const std::vector<SDL_FRect>& opaque);

    /**
     * @brief Converts an SDL mouse event into a resolved pointer event
     * @return std::nullopt if not listening or the event is not a left-button pointer event
     */
    std::optional<std::pair<PointerPhase, PointerEvent>> translateEvent(const SDL_Event& event);

    /**
     * @brief Resolves what lies under a surface-local point
     *
     * Resize handles win over companions; handles span the full height.
     */
    [[nodiscard]] PointerEvent resolve(float x, float y, float screenX, float screenY,
                                       bool modifierHeld) const;

    /**
     * @brief Draws the border and resize handles when visible
     */
    void renderAffordances(SDL_Renderer* renderer) const;

    void setSize(float width, float height);
    [[nodiscard]] float getWidth() const { return m_width; }
    [[nodiscard]] float getHeight() const { return m_height; }

    [[nodiscard]] bool isPassThrough() const { return m_passThrough; }
    [[nodiscard]] bool areAffordancesVisible() const { return m_affordancesVisible; }
    [[nodiscard]] bool isPointerListening() const { return m_listening; }
    [[nodiscard]] InputRegion getInputRegion() const { return m_inputRegion; }

private:
    bool applyPassThroughShape();

    SDL_Window* mp_window;
    HitTester m_hitTester;
    BoundsSource m_boundsSource;
    InputRegion m_inputRegion{InputRegion::Full};
    Uint64 m_lastShapeMs{0};

    float m_width{0.0f};
    float m_height{0.0f};
    bool m_passThrough{true};
    bool m_affordancesVisible{false};
    bool m_listening{false};
    bool m_buttonDown{false};
};

} // namespace PetDock

#endif // SDL_SURFACE_HPP
