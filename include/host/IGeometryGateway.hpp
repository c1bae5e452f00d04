/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IGEOMETRY_GATEWAY_HPP
#define IGEOMETRY_GATEWAY_HPP

#include <functional>
#include <optional>

namespace PetDock {

struct WindowPosition {
    float x{0.0f};
    float y{0.0f};
};

/**
 * @brief Logical window placement. Height is fixed for the surface.
 */
struct WindowGeometry {
    float x{0.0f};
    float y{0.0f};
    float width{0.0f};
    float height{0.0f};
};

/**
 * @brief Host window placement and sizing
 *
 * Every call is asynchronous and fallible: the completion may run inline or
 * at any later point on the main thread. Implementations never throw.
 */
class IGeometryGateway {
public:
    using PositionCallback = std::function<void(std::optional<WindowPosition>)>;
    using ScaleCallback = std::function<void(std::optional<float>)>;
    using CompletionCallback = std::function<void(bool success)>;

    virtual ~IGeometryGateway() = default;

    /**
     * @brief Reads the outer window position in physical pixels
     */
    virtual void getPosition(PositionCallback done) = 0;

    /**
     * @brief Moves the window, logical coordinates
     */
    virtual void setPosition(float x, float y, CompletionCallback done) = 0;

    /**
     * @brief Resizes the window, logical units
     */
    virtual void setSize(float width, float height, CompletionCallback done) = 0;

    /**
     * @brief Physical pixels per logical unit on the active display
     */
    virtual void getScaleFactor(ScaleCallback done) = 0;
};

} // namespace PetDock

#endif // IGEOMETRY_GATEWAY_HPP
