/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/SnapshotFeed.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"

#include <cmath>
#include <format>

namespace PetDock {

SnapshotFeed::SnapshotFeed(std::string path, Uint64 pollIntervalMs)
    : m_path(std::move(path)), m_pollIntervalMs(pollIntervalMs) {}

bool SnapshotFeed::update(Uint64 nowMs, const Consumer& consumer) {
    if (m_lastPollMs.has_value() && nowMs - *m_lastPollMs < m_pollIntervalMs) {
        return false;
    }
    m_lastPollMs = nowMs;

    auto snapshot = load();
    if (!snapshot) {
        return false;
    }
    if (consumer) {
        consumer(*snapshot);
    }
    return true;
}

std::optional<std::vector<CompanionSnapshot>> SnapshotFeed::load() const {
    JsonReader reader;
    if (!reader.loadFromFile(m_path)) {
        SNAPSHOT_ERROR("Failed to read companion snapshot " + m_path + ": " + reader.getLastError());
        return std::nullopt;
    }

    auto snapshot = fromJson(reader.getRoot());
    if (!snapshot) {
        SNAPSHOT_ERROR("Companion snapshot root is not an array: " + m_path);
        return std::nullopt;
    }

    SNAPSHOT_DEBUG(std::format("Loaded {} companions from {}", snapshot->size(), m_path));
    return snapshot;
}

std::optional<std::vector<CompanionSnapshot>> SnapshotFeed::fromJson(const JsonValue& root) {
    if (!root.isArray()) {
        return std::nullopt;
    }

    std::vector<CompanionSnapshot> result;
    result.reserve(root.asArray().size());

    for (const JsonValue& item : root.asArray()) {
        const JsonValue* id = item.find("id");
        if (!id || !id->isString() || id->asString().empty()) {
            SNAPSHOT_WARN("Skipping snapshot entry without a string id");
            continue;
        }

        CompanionSnapshot entry;
        entry.id = id->asString();

        if (const JsonValue* scale = item.find("scale")) {
            const double value = scale->tryAsNumber().value_or(1.0);
            if (std::isfinite(value) && value > 0.0) {
                entry.scale = static_cast<float>(value);
            } else {
                SNAPSHOT_WARN(std::format("Companion {} has invalid scale - using 1.0", entry.id));
            }
        }
        if (const JsonValue* sprite = item.find("sprite")) {
            entry.spritePath = sprite->tryAsString().value_or("");
        }
        if (const JsonValue* stage = item.find("stage")) {
            if (auto text = stage->tryAsString(); text && !text->empty()) {
                entry.stage = *text;
            }
        }
        if (const JsonValue* facing = item.find("default_facing")) {
            entry.defaultFacing = parseSpriteFacing(facing->tryAsString().value_or("left"));
        }

        result.push_back(std::move(entry));
    }

    return result;
}

} // namespace PetDock
