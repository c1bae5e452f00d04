/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/CompanionSettingsStore.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"

#include <algorithm>
#include <format>

namespace PetDock {

CompanionSettingsStore::CompanionSettingsStore(SettingsManager& settings, std::string filepath)
    : m_settings(settings), m_filepath(std::move(filepath)) {}

CompanionSettingsStore::~CompanionSettingsStore() {
    unbindScheduler();
}

std::string CompanionSettingsStore::categoryFor(const std::string& id) {
    return CATEGORY_PREFIX + id;
}

std::optional<std::string> CompanionSettingsStore::idFromCategory(const std::string& category) {
    const std::string prefix(CATEGORY_PREFIX);
    if (!category.starts_with(prefix) || category.size() == prefix.size()) {
        return std::nullopt;
    }
    return category.substr(prefix.size());
}

CompanionDisplaySettings CompanionSettingsStore::getSettings(const std::string& id) const {
    const std::string category = categoryFor(id);

    CompanionDisplaySettings result;
    result.movementEnabled = m_settings.get<bool>(category, KEY_MOVEMENT_ENABLED, true);
    result.movementSpeed = std::clamp(
        m_settings.get<float>(category, KEY_MOVEMENT_SPEED, CompanionConstants::SPEED_DEFAULT),
        CompanionConstants::SPEED_MIN, CompanionConstants::SPEED_MAX);
    if (m_settings.has(category, KEY_POSITION)) {
        result.storedPosition = m_settings.get<float>(category, KEY_POSITION, 0.0f);
    }
    return result;
}

void CompanionSettingsStore::setMovementEnabled(const std::string& id, bool enabled) {
    m_settings.set(categoryFor(id), KEY_MOVEMENT_ENABLED, enabled);
}

void CompanionSettingsStore::setMovementSpeed(const std::string& id, float speed) {
    const float clamped = std::clamp(speed, CompanionConstants::SPEED_MIN, CompanionConstants::SPEED_MAX);
    m_settings.set(categoryFor(id), KEY_MOVEMENT_SPEED, clamped);
}

void CompanionSettingsStore::savePosition(const std::string& id, float x) {
    m_settings.set(categoryFor(id), KEY_POSITION, x);
    SETTINGS_DEBUG(std::format("Stored position {:.1f} for companion {}", x, id));
    save();
}

void CompanionSettingsStore::forget(const std::string& id) {
    m_settings.clearCategory(categoryFor(id));
}

bool CompanionSettingsStore::save() const {
    if (m_filepath.empty()) {
        return true;
    }
    if (!m_settings.saveToFile(m_filepath)) {
        SETTINGS_ERROR("Companion settings not persisted to " + m_filepath);
        return false;
    }
    return true;
}

CompanionScheduler::SettingsGetter CompanionSettingsStore::makeSettingsGetter() const {
    return [this](const std::string& id) { return getSettings(id); };
}

void CompanionSettingsStore::bindScheduler(CompanionScheduler& scheduler) {
    unbindScheduler();
    m_listenerId = m_settings.registerChangeListener(
        "", [this, &scheduler](const std::string& category, const std::string& key,
                               const SettingsManager::SettingValue&) {
            // Position writes come from committed drags the scheduler already knows about
            if (key != KEY_MOVEMENT_ENABLED && key != KEY_MOVEMENT_SPEED) {
                return;
            }
            if (auto id = idFromCategory(category)) {
                scheduler.applySettings(*id, getSettings(*id));
            }
        });
}

void CompanionSettingsStore::unbindScheduler() {
    if (m_listenerId.has_value()) {
        m_settings.unregisterChangeListener(*m_listenerId);
        m_listenerId.reset();
    }
}

} // namespace PetDock
