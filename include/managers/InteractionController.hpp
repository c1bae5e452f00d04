/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef INTERACTION_CONTROLLER_HPP
#define INTERACTION_CONTROLLER_HPP

/**
 * @file InteractionController.hpp
 * @brief Pass-through / interactive mode switch and the gestures it enables
 *
 * In pass-through mode the surface ignores the pointer. Holding the global
 * hotkey for holdDurationMs toggles interactive mode, where the user can:
 *  - drag the window (modifier held)
 *  - resize it from the left or right handle
 *  - drag a single companion along the floor
 *
 * Window writes go through IGeometryGateway and are serialized: at most one
 * write is in flight and only the latest requested geometry is queued
 * behind it. Asynchronous results that arrive after their gesture ended are
 * dropped.
 *
 * The controller never touches the scheduler directly. It goes through the
 * InteractionBridge it was given.
 */

#include "core/FrameTimerQueue.hpp"
#include "host/IGeometryGateway.hpp"
#include "host/IHotkeyService.hpp"
#include "host/ISurface.hpp"
#include "managers/InteractionBridge.hpp"

#include <SDL3/SDL_stdinc.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

namespace PetDock {

enum class InteractionMode : uint8_t { PassThrough, Interactive };

enum class Gesture : uint8_t { None, DraggingWindow, ResizingWindow, DraggingEntity };

std::ostream& operator<<(std::ostream& os, InteractionMode mode);
std::ostream& operator<<(std::ostream& os, Gesture gesture);

struct InteractionConfig {
    std::string hotkeyCombination{"CommandOrControl+O"};
    Uint64 holdDurationMs{500};
    float minWindowWidth{400.0f};
    float entityMargin{10.0f};
    // Pointer travel below this counts as a click on a companion
    float clickSlop{3.0f};
    WindowGeometry initialGeometry{0.0f, 0.0f, 800.0f, 200.0f};
};

/**
 * @brief Outward notifications, all optional
 */
struct InteractionCallbacks {
    // Final geometry after a window drag or resize
    std::function<void(const WindowGeometry&)> onWindowConfigChanged;
    // Committed entity drag, for persistence
    std::function<void(const std::string& id, float x)> onCompanionPositionChanged;
    // Pointer went down and up on a companion without moving it
    std::function<void(const std::string& id)> onCompanionClicked;
};

class InteractionController {
public:
    using Clock = std::function<Uint64()>;

    InteractionController(const InteractionConfig& config,
                          IGeometryGateway& gateway,
                          IHotkeyService& hotkeys,
                          ISurface& surface,
                          FrameTimerQueue& timers,
                          Clock clock,
                          InteractionBridge bridge,
                          InteractionCallbacks callbacks = {});
    ~InteractionController();

    InteractionController(const InteractionController&) = delete;
    InteractionController& operator=(const InteractionController&) = delete;

    /**
     * @brief Enters pass-through mode and registers the hotkey
     *
     * A failed registration is logged; the surface stays usable but
     * interactive mode can no longer be reached.
     */
    void start();

    /**
     * @brief Leaves interactive mode, cancels the hold timer, unregisters the hotkey
     */
    void stop();

    /**
     * @brief stop() plus detaching every callback
     *
     * Gateway and hotkey completions that are still outstanding become no-ops.
     */
    void dispose();

    // --- Pointer input (surface-local + screen coordinates) ---

    void onPointerDown(const PointerEvent& event);
    void onPointerMove(const PointerEvent& event);
    void onPointerUp(const PointerEvent& event);

    /**
     * @brief External width change (settings, display change)
     *
     * Clamped to the minimum width and forwarded through the bridge.
     */
    void setWindowWidth(float width);

    // --- Queries ---

    [[nodiscard]] InteractionMode getMode() const { return m_mode; }
    [[nodiscard]] bool isInteractive() const { return m_mode == InteractionMode::Interactive; }
    [[nodiscard]] Gesture getGesture() const { return m_gesture; }
    [[nodiscard]] ResizeEdge getResizeEdge() const { return m_anchor.edge; }
    [[nodiscard]] const WindowGeometry& getGeometry() const { return m_geometry; }
    [[nodiscard]] bool isHoldPending() const { return m_holdTimer != INVALID_TIMER; }
    [[nodiscard]] bool isHotkeyRegistered() const { return m_hotkeyRegistered; }
    [[nodiscard]] bool isWriteInFlight() const { return m_writeInFlight; }
    [[nodiscard]] bool isStarted() const { return m_started; }

private:
    struct GestureAnchor {
        ResizeEdge edge{ResizeEdge::None};
        // Screen coordinates for window gestures, surface-local for entity drags
        float pointerX{0.0f};
        float pointerY{0.0f};
        WindowGeometry window;
        bool windowResolved{false};
        std::string entityId;
        std::weak_ptr<ICompanionVisual> entityVisual;
        float entityPosition{0.0f};
        bool entityMoved{false};
    };

    struct GeometryWrite {
        WindowGeometry geometry;
        bool includesSize{false};
    };

    // Hotkey hold state machine
    void handleHotkey(HotkeyState state);
    void onHoldElapsed();
    void cancelHoldTimer();

    void toggleMode();
    void enterInteractive();
    void exitInteractive();

    // Gestures
    void beginWindowGesture(Gesture gesture, ResizeEdge edge, const PointerEvent& event);
    void beginEntityDrag(const PointerEvent& event);
    void resolveWindowOrigin(uint64_t generation);
    void applyWindowMove(float screenX, float screenY);
    void applyEntityMove(float surfaceX);
    void finishGesture();
    void abortGesture();

    // Serialized window writes
    void requestGeometry(const WindowGeometry& geometry, bool includesSize);
    void issueWrite(const GeometryWrite& write);
    void onWriteFinished();

    InteractionConfig m_config;
    IGeometryGateway& m_gateway;
    IHotkeyService& m_hotkeys;
    ISurface& m_surface;
    FrameTimerQueue& m_timers;
    Clock m_clock;
    InteractionBridge m_bridge;
    InteractionCallbacks m_callbacks;

    InteractionMode m_mode{InteractionMode::PassThrough};
    bool m_started{false};
    bool m_hotkeyRegistered{false};
    bool m_hotkeyDown{false};
    TimerHandle m_holdTimer{INVALID_TIMER};

    Gesture m_gesture{Gesture::None};
    GestureAnchor m_anchor;
    // Bumped whenever a gesture starts or ends
    uint64_t m_gestureGeneration{0};
    // Latest screen pointer seen before the window origin resolved
    std::optional<WindowPosition> m_deferredPointer;

    WindowGeometry m_geometry;
    bool m_writeInFlight{false};
    std::optional<GeometryWrite> m_queuedWrite;

    // Expires on dispose or destruction; guards async completions
    std::shared_ptr<bool> m_alive;
};

} // namespace PetDock

#endif // INTERACTION_CONTROLLER_HPP
