/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/InteractionBridge.hpp"
#include "managers/CompanionScheduler.hpp"

namespace PetDock {

InteractionBridge InteractionBridge::connect(CompanionScheduler& scheduler) {
    InteractionBridge bridge;
    bridge.onWindowWidthChanged = [&scheduler](float width) {
        scheduler.setContainerWidth(width);
    };
    bridge.onEntityRepositioned = [&scheduler](const std::string& id) {
        scheduler.notifyExternalReposition(id);
    };
    return bridge;
}

} // namespace PetDock
