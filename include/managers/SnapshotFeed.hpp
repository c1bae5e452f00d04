/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SNAPSHOT_FEED_HPP
#define SNAPSHOT_FEED_HPP

/**
 * @file SnapshotFeed.hpp
 * @brief Polls the list of companions that should currently exist
 *
 * The snapshot is a JSON array:
 *   [ { "id": "abc", "scale": 1.2, "sprite": "res/sprites/cat.png",
 *       "stage": "adult", "default_facing": "right" } ]
 *
 * Every poll that reads and parses successfully hands the full list to the
 * consumer (normally CompanionScheduler::reconcile). A failed poll is logged
 * and delivers nothing, so the registry keeps its last known contents.
 */

#include "entities/CompanionTypes.hpp"

#include <SDL3/SDL_stdinc.h>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace PetDock {

class JsonValue;

class SnapshotFeed {
public:
    using Consumer = std::function<void(const std::vector<CompanionSnapshot>&)>;

    SnapshotFeed(std::string path, Uint64 pollIntervalMs);

    /**
     * @brief Polls if the interval has elapsed (the first call always polls)
     * @return true if a snapshot was delivered to the consumer
     */
    bool update(Uint64 nowMs, const Consumer& consumer);

    /**
     * @brief Reads and parses the snapshot file right now
     */
    [[nodiscard]] std::optional<std::vector<CompanionSnapshot>> load() const;

    /**
     * @brief Converts parsed JSON into snapshot entries
     * @return std::nullopt if the root is not an array; malformed entries are skipped
     */
    [[nodiscard]] static std::optional<std::vector<CompanionSnapshot>> fromJson(const JsonValue& root);

    [[nodiscard]] const std::string& getPath() const { return m_path; }
    [[nodiscard]] Uint64 getPollInterval() const { return m_pollIntervalMs; }

private:
    std::string m_path;
    Uint64 m_pollIntervalMs;
    std::optional<Uint64> m_lastPollMs;
};

} // namespace PetDock

#endif // SNAPSHOT_FEED_HPP
