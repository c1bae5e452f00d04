/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMPANION_SETTINGS_STORE_HPP
#define COMPANION_SETTINGS_STORE_HPP

#include "entities/CompanionTypes.hpp"
#include "managers/CompanionScheduler.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace PetDock {

class SettingsManager;

/**
 * @brief Per-companion display settings on top of SettingsManager
 *
 * Each companion id owns the category "companion.<id>" with the keys
 * movement_enabled, movement_speed and x. Unknown ids read as defaults.
 *
 * Usage:
 *   CompanionSettingsStore store(SettingsManager::Instance(), settingsPath);
 *   scheduler.setSettingsGetter(store.makeSettingsGetter());
 *   store.bindScheduler(scheduler);
 *   store.setMovementSpeed("abc", 1.5f);  // reaches the scheduler right away
 */
class CompanionSettingsStore {
public:
    static constexpr const char* CATEGORY_PREFIX = "companion.";
    static constexpr const char* KEY_MOVEMENT_ENABLED = "movement_enabled";
    static constexpr const char* KEY_MOVEMENT_SPEED = "movement_speed";
    static constexpr const char* KEY_POSITION = "x";

    /**
     * @param settings Backing store
     * @param filepath File written by save(); empty keeps changes in memory
     */
    CompanionSettingsStore(SettingsManager& settings, std::string filepath);
    ~CompanionSettingsStore();

    CompanionSettingsStore(const CompanionSettingsStore&) = delete;
    CompanionSettingsStore& operator=(const CompanionSettingsStore&) = delete;

    [[nodiscard]] static std::string categoryFor(const std::string& id);

    /**
     * @brief Companion id encoded in a settings category
     * @return std::nullopt if the category is not a companion category
     */
    [[nodiscard]] static std::optional<std::string> idFromCategory(const std::string& category);

    [[nodiscard]] CompanionDisplaySettings getSettings(const std::string& id) const;

    void setMovementEnabled(const std::string& id, bool enabled);
    void setMovementSpeed(const std::string& id, float speed);

    /**
     * @brief Persists a committed drag position and writes the file
     */
    void savePosition(const std::string& id, float x);

    /**
     * @brief Drops every stored value for a companion
     */
    void forget(const std::string& id);

    bool save() const;

    [[nodiscard]] CompanionScheduler::SettingsGetter makeSettingsGetter() const;

    /**
     * @brief Pushes movement setting changes to the scheduler as they happen
     * @note The scheduler must outlive the binding; unbindScheduler() or
     *       destruction removes it
     */
    void bindScheduler(CompanionScheduler& scheduler);
    void unbindScheduler();

private:
    SettingsManager& m_settings;
    std::string m_filepath;
    std::optional<size_t> m_listenerId;
};

} // namespace PetDock

#endif // COMPANION_SETTINGS_STORE_HPP
