/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ISURFACE_HPP
#define ISURFACE_HPP

#include "render/ICompanionVisual.hpp"

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>

namespace PetDock {

enum class ResizeEdge : uint8_t { None, Left, Right };

inline std::ostream& operator<<(std::ostream& os, ResizeEdge edge) {
    switch (edge) {
    case ResizeEdge::Left:
        return os << "Left";
    case ResizeEdge::Right:
        return os << "Right";
    default:
        return os << "None";
    }
}

enum class PointerTarget : uint8_t {
    Surface,      // Empty area of the surface
    ResizeHandle, // One of the edge resize affordances
    Companion     // A companion's visual handle
};

/**
 * @brief Pointer event already resolved against the surface contents
 */
struct PointerEvent {
    // Surface-local coordinates
    float x{0.0f};
    float y{0.0f};
    // Global screen coordinates (stable while the window itself moves)
    float screenX{0.0f};
    float screenY{0.0f};
    // Window-drag modifier (Shift)
    bool modifierHeld{false};

    PointerTarget target{PointerTarget::Surface};
    ResizeEdge handleEdge{ResizeEdge::None};
    std::string companionId;
    std::weak_ptr<ICompanionVisual> companionVisual;
};

/**
 * @brief Visual and input affordances of the borderless surface
 */
class ISurface {
public:
    virtual ~ISurface() = default;

    /**
     * @brief Lets pointer input fall through to whatever lies beneath
     * @return false if the host refused the change
     */
    virtual bool setPointerPassThrough(bool passThrough) = 0;

    // Border outline and left/right resize handles
    virtual void setAffordancesVisible(bool visible) = 0;

    // Whether pointer down/move/up are delivered to the controller
    virtual void setPointerListening(bool listening) = 0;
};

} // namespace PetDock

#endif // ISURFACE_HPP
