/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/InteractionController.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace PetDock {

std::ostream& operator<<(std::ostream& os, InteractionMode mode) {
    return os << (mode == InteractionMode::Interactive ? "Interactive" : "PassThrough");
}

namespace {

const char* gestureName(Gesture gesture) {
    switch (gesture) {
    case Gesture::DraggingWindow:
        return "DraggingWindow";
    case Gesture::ResizingWindow:
        return "ResizingWindow";
    case Gesture::DraggingEntity:
        return "DraggingEntity";
    default:
        return "None";
    }
}

} // namespace

std::ostream& operator<<(std::ostream& os, Gesture gesture) {
    return os << gestureName(gesture);
}

InteractionController::InteractionController(const InteractionConfig& config,
                                             IGeometryGateway& gateway,
                                             IHotkeyService& hotkeys,
                                             ISurface& surface,
                                             FrameTimerQueue& timers,
                                             Clock clock,
                                             InteractionBridge bridge,
                                             InteractionCallbacks callbacks)
    : m_config(config),
      m_gateway(gateway),
      m_hotkeys(hotkeys),
      m_surface(surface),
      m_timers(timers),
      m_clock(std::move(clock)),
      m_bridge(std::move(bridge)),
      m_callbacks(std::move(callbacks)),
      m_geometry(config.initialGeometry),
      m_alive(std::make_shared<bool>(true)) {
    m_geometry.width = std::max(m_geometry.width, m_config.minWindowWidth);
}

InteractionController::~InteractionController() {
    dispose();
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

void InteractionController::start() {
    if (m_started || !m_alive) {
        return;
    }
    m_started = true;

    m_mode = InteractionMode::PassThrough;
    if (!m_surface.setPointerPassThrough(true)) {
        INTERACTION_ERROR("Host refused pointer pass-through - surface will swallow clicks");
    }
    m_surface.setAffordancesVisible(false);
    m_surface.setPointerListening(false);

    std::weak_ptr<bool> alive = m_alive;
    const std::string combination = m_config.hotkeyCombination;
    m_hotkeys.registerHotkey(
        combination,
        [this, alive](HotkeyState state) {
            if (alive.expired()) {
                return;
            }
            handleHotkey(state);
        },
        [this, alive, combination](bool success) {
            if (alive.expired()) {
                return;
            }
            m_hotkeyRegistered = success;
            if (success) {
                INTERACTION_INFO("Registered hotkey " + combination);
            } else {
                INTERACTION_ERROR("Failed to register hotkey " + combination +
                                  " - interactive mode unreachable");
            }
        });
}

void InteractionController::stop() {
    if (!m_started) {
        return;
    }
    m_started = false;

    cancelHoldTimer();
    m_hotkeyDown = false;

    if (m_mode == InteractionMode::Interactive) {
        m_mode = InteractionMode::PassThrough;
        exitInteractive();
    }

    if (m_hotkeyRegistered) {
        m_hotkeyRegistered = false;
        const std::string combination = m_config.hotkeyCombination;
        // Completion may outlive the controller, so it captures nothing of it
        m_hotkeys.unregisterHotkey(combination, [combination](bool success) {
            if (!success) {
                INTERACTION_WARN("Failed to unregister hotkey " + combination);
            }
        });
    }
}

void InteractionController::dispose() {
    stop();
    m_alive.reset();
    m_queuedWrite.reset();
    m_deferredPointer.reset();
    m_bridge = InteractionBridge{};
    m_callbacks = InteractionCallbacks{};
}

// ---------------------------------------------------------------------------
// Hotkey hold
// ---------------------------------------------------------------------------

void InteractionController::handleHotkey(HotkeyState state) {
    if (state == HotkeyState::Pressed) {
        // Key repeat while held: the first press owns the timer
        if (m_hotkeyDown) {
            return;
        }
        m_hotkeyDown = true;
        m_holdTimer = m_timers.schedule(
            m_config.holdDurationMs, [this]() { onHoldElapsed(); }, m_clock());
        INTERACTION_DEBUG("Hotkey pressed");
    } else {
        m_hotkeyDown = false;
        cancelHoldTimer();
        INTERACTION_DEBUG("Hotkey released");
    }
}

void InteractionController::onHoldElapsed() {
    m_holdTimer = INVALID_TIMER;
    if (!m_hotkeyDown) {
        return;
    }
    toggleMode();
}

void InteractionController::cancelHoldTimer() {
    if (m_holdTimer != INVALID_TIMER) {
        m_timers.cancel(m_holdTimer);
        m_holdTimer = INVALID_TIMER;
    }
}

// ---------------------------------------------------------------------------
// Mode
// ---------------------------------------------------------------------------

void InteractionController::toggleMode() {
    if (m_mode == InteractionMode::Interactive) {
        m_mode = InteractionMode::PassThrough;
        exitInteractive();
    } else {
        m_mode = InteractionMode::Interactive;
        enterInteractive();
    }
    INTERACTION_INFO(m_mode == InteractionMode::Interactive ? "Interactive mode ON"
                                                            : "Interactive mode OFF");
}

void InteractionController::enterInteractive() {
    if (!m_surface.setPointerPassThrough(false)) {
        INTERACTION_ERROR("Host refused to disable pointer pass-through");
    }
    m_surface.setAffordancesVisible(true);
    m_surface.setPointerListening(true);
}

void InteractionController::exitInteractive() {
    abortGesture();
    if (!m_surface.setPointerPassThrough(true)) {
        INTERACTION_ERROR("Host refused to re-enable pointer pass-through");
    }
    m_surface.setAffordancesVisible(false);
    m_surface.setPointerListening(false);
}

// ---------------------------------------------------------------------------
// Pointer input
// ---------------------------------------------------------------------------

void InteractionController::onPointerDown(const PointerEvent& event) {
    if (m_mode != InteractionMode::Interactive) {
        return;
    }
    if (m_gesture != Gesture::None) {
        // Release was lost somewhere (e.g. outside the window); start over
        INTERACTION_WARN(std::format("Pointer down during active gesture {}", gestureName(m_gesture)));
        abortGesture();
    }

    // Handle beats modifier beats companion
    if (event.target == PointerTarget::ResizeHandle && event.handleEdge != ResizeEdge::None) {
        beginWindowGesture(Gesture::ResizingWindow, event.handleEdge, event);
    } else if (event.modifierHeld) {
        beginWindowGesture(Gesture::DraggingWindow, ResizeEdge::None, event);
    } else if (event.target == PointerTarget::Companion) {
        beginEntityDrag(event);
    }
}

void InteractionController::onPointerMove(const PointerEvent& event) {
    switch (m_gesture) {
    case Gesture::DraggingWindow:
    case Gesture::ResizingWindow:
        if (!m_anchor.windowResolved) {
            m_deferredPointer = WindowPosition{event.screenX, event.screenY};
            return;
        }
        applyWindowMove(event.screenX, event.screenY);
        break;
    case Gesture::DraggingEntity:
        applyEntityMove(event.x);
        break;
    default:
        break;
    }
}

void InteractionController::onPointerUp(const PointerEvent& /*event*/) {
    if (m_gesture == Gesture::None) {
        return;
    }
    finishGesture();
}

void InteractionController::setWindowWidth(float width) {
    // The resize gesture owns the width until release
    if (m_gesture == Gesture::ResizingWindow) {
        return;
    }
    const float clamped = std::max(width, m_config.minWindowWidth);
    if (clamped == m_geometry.width) {
        return;
    }
    m_geometry.width = clamped;
    if (m_bridge.onWindowWidthChanged) {
        m_bridge.onWindowWidthChanged(clamped);
    }
}

// ---------------------------------------------------------------------------
// Gestures
// ---------------------------------------------------------------------------

void InteractionController::beginWindowGesture(Gesture gesture, ResizeEdge edge,
                                               const PointerEvent& event) {
    const uint64_t generation = ++m_gestureGeneration;
    m_gesture = gesture;
    m_anchor = GestureAnchor{};
    m_anchor.edge = edge;
    m_anchor.pointerX = event.screenX;
    m_anchor.pointerY = event.screenY;
    m_anchor.window = m_geometry;
    m_deferredPointer.reset();

    INTERACTION_DEBUG(std::format("Window gesture start (resize={}) at {:.0f},{:.0f}",
                                  gesture == Gesture::ResizingWindow, event.screenX, event.screenY));
    resolveWindowOrigin(generation);
}

void InteractionController::beginEntityDrag(const PointerEvent& event) {
    auto visual = event.companionVisual.lock();
    if (!visual) {
        return;
    }

    ++m_gestureGeneration;
    m_gesture = Gesture::DraggingEntity;
    m_anchor = GestureAnchor{};
    m_anchor.pointerX = event.x;
    m_anchor.pointerY = event.y;
    m_anchor.entityId = event.companionId;
    m_anchor.entityVisual = visual;
    m_anchor.entityPosition = visual->getPosition();
    visual->setDragged(true);

    INTERACTION_DEBUG(std::format("Entity drag start for {} at x={:.1f}", event.companionId,
                                  m_anchor.entityPosition));
}

void InteractionController::resolveWindowOrigin(uint64_t generation) {
    std::weak_ptr<bool> alive = m_alive;
    m_gateway.getScaleFactor([this, alive, generation](std::optional<float> scale) {
        if (alive.expired() || generation != m_gestureGeneration) {
            return;
        }
        float factor = scale.value_or(1.0f);
        if (!scale.has_value() || factor <= 0.0f) {
            INTERACTION_WARN("Scale factor unavailable - assuming 1.0");
            factor = 1.0f;
        }

        m_gateway.getPosition([this, alive, generation, factor](std::optional<WindowPosition> position) {
            if (alive.expired() || generation != m_gestureGeneration) {
                return;
            }
            if (position.has_value()) {
                // Physical pixels to logical units
                m_anchor.window.x = position->x / factor;
                m_anchor.window.y = position->y / factor;
                m_geometry.x = m_anchor.window.x;
                m_geometry.y = m_anchor.window.y;
            } else {
                INTERACTION_WARN("Window position unavailable - using last known geometry");
            }
            m_anchor.windowResolved = true;

            if (m_deferredPointer.has_value()) {
                const WindowPosition pointer = *m_deferredPointer;
                m_deferredPointer.reset();
                applyWindowMove(pointer.x, pointer.y);
            }
        });
    });
}

void InteractionController::applyWindowMove(float screenX, float screenY) {
    const float dx = screenX - m_anchor.pointerX;
    const float dy = screenY - m_anchor.pointerY;
    const WindowGeometry& origin = m_anchor.window;

    if (m_gesture == Gesture::DraggingWindow) {
        m_geometry.x = origin.x + dx;
        m_geometry.y = std::max(0.0f, origin.y + dy);
        requestGeometry(m_geometry, false);
        return;
    }

    float newWidth = origin.width;
    float newX = origin.x;
    if (m_anchor.edge == ResizeEdge::Right) {
        newWidth = std::max(m_config.minWindowWidth, origin.width + dx);
    } else if (m_anchor.edge == ResizeEdge::Left) {
        newWidth = origin.width - dx;
        newX = origin.x + dx;
        if (newWidth < m_config.minWindowWidth) {
            // Right edge stays put when the floor is hit
            newWidth = m_config.minWindowWidth;
            newX = origin.x + (origin.width - m_config.minWindowWidth);
        }
    }

    const bool widthChanged = newWidth != m_geometry.width;
    m_geometry.x = newX;
    m_geometry.y = origin.y;
    m_geometry.width = newWidth;
    requestGeometry(m_geometry, true);

    if (widthChanged && m_bridge.onWindowWidthChanged) {
        m_bridge.onWindowWidthChanged(newWidth);
    }
}

void InteractionController::applyEntityMove(float surfaceX) {
    auto visual = m_anchor.entityVisual.lock();
    if (!visual) {
        // Companion was torn down mid-drag
        INTERACTION_DEBUG("Dragged companion " + m_anchor.entityId + " no longer exists");
        ++m_gestureGeneration;
        m_gesture = Gesture::None;
        m_anchor = GestureAnchor{};
        return;
    }

    const float dx = surfaceX - m_anchor.pointerX;
    const float lo = m_config.entityMargin;
    const float hi = std::max(lo, m_geometry.width - visual->getRenderedWidth() - m_config.entityMargin);
    visual->setPosition(std::clamp(m_anchor.entityPosition + dx, lo, hi));

    if (std::fabs(dx) > m_config.clickSlop) {
        m_anchor.entityMoved = true;
    }
}

void InteractionController::finishGesture() {
    const Gesture gesture = m_gesture;
    GestureAnchor anchor = std::move(m_anchor);

    ++m_gestureGeneration;
    m_gesture = Gesture::None;
    m_anchor = GestureAnchor{};
    m_deferredPointer.reset();

    if (gesture == Gesture::DraggingEntity) {
        auto visual = anchor.entityVisual.lock();
        if (!visual) {
            return;
        }
        visual->setDragged(false);

        if (!anchor.entityMoved) {
            // Jitter inside the slop is not a reposition
            visual->setPosition(anchor.entityPosition);
            if (m_callbacks.onCompanionClicked) {
                m_callbacks.onCompanionClicked(anchor.entityId);
            }
            return;
        }

        const float x = visual->getPosition();
        INTERACTION_DEBUG(std::format("Entity drag committed for {} at x={:.1f}", anchor.entityId, x));
        if (m_bridge.onEntityRepositioned) {
            m_bridge.onEntityRepositioned(anchor.entityId);
        }
        if (m_callbacks.onCompanionPositionChanged) {
            m_callbacks.onCompanionPositionChanged(anchor.entityId, x);
        }
        return;
    }

    // Window drag or resize: m_geometry already holds the final requested geometry
    INTERACTION_DEBUG(std::format("Window gesture end: {:.0f},{:.0f} {:.0f}x{:.0f}",
                                  m_geometry.x, m_geometry.y, m_geometry.width, m_geometry.height));
    if (m_callbacks.onWindowConfigChanged) {
        m_callbacks.onWindowConfigChanged(m_geometry);
    }
}

void InteractionController::abortGesture() {
    if (m_gesture == Gesture::DraggingEntity) {
        // Transient phase only: put the visual back where the scheduler left it
        if (auto visual = m_anchor.entityVisual.lock()) {
            visual->setPosition(m_anchor.entityPosition);
            visual->setDragged(false);
        }
    }
    if (m_gesture != Gesture::None) {
        INTERACTION_DEBUG("Gesture aborted");
    }

    ++m_gestureGeneration;
    m_gesture = Gesture::None;
    m_anchor = GestureAnchor{};
    m_deferredPointer.reset();
}

// ---------------------------------------------------------------------------
// Window writes
// ---------------------------------------------------------------------------

void InteractionController::requestGeometry(const WindowGeometry& geometry, bool includesSize) {
    if (m_writeInFlight) {
        // Latest wins, but a size change stays pending until written
        const bool sizePending = m_queuedWrite.has_value() && m_queuedWrite->includesSize;
        m_queuedWrite = GeometryWrite{geometry, includesSize || sizePending};
        return;
    }
    issueWrite(GeometryWrite{geometry, includesSize});
}

void InteractionController::issueWrite(const GeometryWrite& write) {
    m_writeInFlight = true;
    std::weak_ptr<bool> alive = m_alive;

    m_gateway.setPosition(write.geometry.x, write.geometry.y, [this, alive, write](bool success) {
        if (alive.expired()) {
            return;
        }
        if (!success) {
            GEOMETRY_WARN(std::format("Window move to {:.0f},{:.0f} failed",
                                      write.geometry.x, write.geometry.y));
        }
        if (!write.includesSize) {
            onWriteFinished();
            return;
        }

        m_gateway.setSize(write.geometry.width, write.geometry.height, [this, alive, write](bool sized) {
            if (alive.expired()) {
                return;
            }
            if (!sized) {
                GEOMETRY_WARN(std::format("Window resize to {:.0f}x{:.0f} failed",
                                          write.geometry.width, write.geometry.height));
            }
            onWriteFinished();
        });
    });
}

void InteractionController::onWriteFinished() {
    m_writeInFlight = false;
    if (!m_queuedWrite.has_value()) {
        return;
    }
    const GeometryWrite next = *m_queuedWrite;
    m_queuedWrite.reset();
    issueWrite(next);
}

} // namespace PetDock
