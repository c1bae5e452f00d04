/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef INTERACTION_BRIDGE_HPP
#define INTERACTION_BRIDGE_HPP

/**
 * @file InteractionBridge.hpp
 * @brief The only two calls the interaction controller may make into the scheduler
 *
 * Keeping the coupling down to these two callbacks lets each state machine be
 * tested on its own: controller tests capture the calls, scheduler tests make
 * them directly.
 */

#include <functional>
#include <string>

namespace PetDock {

class CompanionScheduler;

struct InteractionBridge {
    // Controller -> CompanionScheduler::setContainerWidth
    std::function<void(float width)> onWindowWidthChanged;
    // Controller -> CompanionScheduler::notifyExternalReposition
    std::function<void(const std::string& id)> onEntityRepositioned;

    /**
     * @brief Wires both callbacks to a scheduler
     * @note The scheduler must outlive every copy of the returned bridge
     */
    [[nodiscard]] static InteractionBridge connect(CompanionScheduler& scheduler);
};

} // namespace PetDock

#endif // INTERACTION_BRIDGE_HPP
