/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMPANION_TYPES_HPP
#define COMPANION_TYPES_HPP

#include <SDL3/SDL_stdinc.h>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace PetDock {

// Walk heading along the horizontal axis. Forward = increasing x.
enum class WalkDirection : uint8_t { Forward, Backward };

// Intrinsic orientation of a companion's sprite asset
enum class SpriteFacing : uint8_t { Left, Right };

// Stream operators (for Boost.Test)
inline std::ostream& operator<<(std::ostream& os, WalkDirection dir) {
    return os << (dir == WalkDirection::Forward ? "Forward" : "Backward");
}

inline std::ostream& operator<<(std::ostream& os, SpriteFacing facing) {
    return os << (facing == SpriteFacing::Left ? "Left" : "Right");
}

[[nodiscard]] inline float directionSign(WalkDirection dir) {
    return dir == WalkDirection::Forward ? 1.0f : -1.0f;
}

/**
 * @brief Mirror rule: the image is flipped iff the asset's facing disagrees
 *        with the walk heading.
 */
[[nodiscard]] inline bool needsMirror(SpriteFacing facing, WalkDirection dir) {
    return (facing == SpriteFacing::Left && dir == WalkDirection::Forward) ||
           (facing == SpriteFacing::Right && dir == WalkDirection::Backward);
}

[[nodiscard]] inline SpriteFacing parseSpriteFacing(std::string_view text) {
    return text == "right" ? SpriteFacing::Right : SpriteFacing::Left;
}

namespace CompanionConstants {
    // Movement speed range (units per tick)
    inline constexpr float SPEED_MIN = 0.3f;
    inline constexpr float SPEED_MAX = 2.0f;
    inline constexpr float SPEED_DEFAULT = 1.0f;

    // Per-companion speed variation, fixed at creation
    inline constexpr float SPEED_MULTIPLIER_MIN = 0.8f;
    inline constexpr float SPEED_MULTIPLIER_MAX = 1.2f;

    // Distance kept from the container edges
    inline constexpr float EDGE_MARGIN = 10.0f;

    // Target selection
    inline constexpr float MIN_TARGET_DISTANCE = 50.0f;
    inline constexpr float MIN_SPAN_FOR_DISTANCE_RULE = 100.0f;

    // Spawn range is [SPAWN_INSET, containerWidth - SPAWN_INSET)
    inline constexpr float SPAWN_INSET = 50.0f;

    // Rest duration range [min, max) in milliseconds
    inline constexpr Uint64 REST_MIN_MS = 2000;
    inline constexpr Uint64 REST_MAX_MS = 8000;

    // Sizing
    inline constexpr float BASE_SIZE = 64.0f;
    inline constexpr float BASE_DISPLAY_MULTIPLIER = 1.5f;
    inline constexpr float REFERENCE_SCREEN_WIDTH = 1920.0f;
    inline constexpr float REFERENCE_SCREEN_HEIGHT = 1080.0f;
    inline constexpr float MIN_SCREEN_SCALE = 0.75f;
    inline constexpr float MAX_SCREEN_SCALE = 1.5f;

    // Lifecycle stage that never moves
    inline constexpr std::string_view EGG_STAGE = "egg";
}

/**
 * @brief One entry of the entity snapshot feed
 */
struct CompanionSnapshot {
    std::string id;
    float scale{1.0f};
    std::string spritePath;
    std::string stage{CompanionConstants::EGG_STAGE};
    SpriteFacing defaultFacing{SpriteFacing::Left};
};

/**
 * @brief Per-companion display settings, owned by the settings collaborator
 */
struct CompanionDisplaySettings {
    bool movementEnabled{true};
    float movementSpeed{CompanionConstants::SPEED_DEFAULT};
    // Last committed drag position, used only when the companion is created
    std::optional<float> storedPosition;
};

/**
 * @brief Committed motion state of one companion
 *
 * Owned exclusively by CompanionScheduler.
 */
struct CompanionState {
    std::string id;
    float position{0.0f};
    WalkDirection direction{WalkDirection::Forward};
    float targetPosition{0.0f};
    bool isResting{false};
    Uint64 restUntil{0};
    float speedMultiplier{1.0f};
    float baseSpeed{CompanionConstants::SPEED_DEFAULT};
    float scaleFactor{1.0f};
    std::string spritePath;
    std::string stage{CompanionConstants::EGG_STAGE};
    SpriteFacing defaultFacing{SpriteFacing::Left};
    bool movementEnabled{true};

    [[nodiscard]] bool isEgg() const { return stage == CompanionConstants::EGG_STAGE; }
    [[nodiscard]] float effectiveSpeed() const { return baseSpeed * speedMultiplier; }
};

} // namespace PetDock

#endif // COMPANION_TYPES_HPP
