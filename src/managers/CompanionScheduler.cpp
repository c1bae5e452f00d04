/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/CompanionScheduler.hpp"
#include "core/Logger.hpp"

#include <boost/container/small_vector.hpp>
#include <algorithm>
#include <cmath>
#include <exception>
#include <format>
#include <unordered_set>

namespace PetDock {

CompanionScheduler::CompanionScheduler(const SchedulerConfig& config, VisualFactory visualFactory)
    : m_config(config),
      m_visualFactory(std::move(visualFactory)),
      m_containerWidth(config.initialContainerWidth),
      m_rng(config.seed != 0 ? config.seed : std::random_device{}()) {
    if (m_config.restMaxMs <= m_config.restMinMs) {
        m_config.restMaxMs = m_config.restMinMs + 1;
    }
}

CompanionScheduler::~CompanionScheduler() {
    dispose();
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

void CompanionScheduler::start() {
    if (m_running) {
        return;
    }
    m_running = true;
    for (auto& [id, companion] : m_companions) {
        updateWalking(companion);
    }
    SCHEDULER_INFO(std::format("Animation started for {} companions", m_companions.size()));
}

void CompanionScheduler::stop() {
    if (!m_running) {
        return;
    }
    m_running = false;
    for (auto& [id, companion] : m_companions) {
        updateWalking(companion);
    }
    SCHEDULER_INFO("Animation stopped");
}

void CompanionScheduler::dispose() {
    stop();
    if (!m_companions.empty()) {
        SCHEDULER_INFO(std::format("Releasing {} companions", m_companions.size()));
    }
    m_companions.clear();
}

void CompanionScheduler::togglePause() {
    m_paused = !m_paused;
    for (auto& [id, companion] : m_companions) {
        updateWalking(companion);
    }
    SCHEDULER_DEBUG(m_paused ? "Paused" : "Resumed");
}

// ---------------------------------------------------------------------------
// Snapshot feed
// ---------------------------------------------------------------------------

void CompanionScheduler::reconcile(const std::vector<CompanionSnapshot>& snapshot) {
    std::unordered_set<std::string> wanted;
    wanted.reserve(snapshot.size());
    for (const auto& entry : snapshot) {
        if (!entry.id.empty()) {
            wanted.insert(entry.id);
        }
    }

    // Tear down first so the registry never holds stale and new ids together
    boost::container::small_vector<std::string, 8> stale;
    for (const auto& [id, companion] : m_companions) {
        if (wanted.find(id) == wanted.end()) {
            stale.push_back(id);
        }
    }
    for (const auto& id : stale) {
        removeCompanion(id);
    }

    for (const auto& entry : snapshot) {
        if (entry.id.empty()) {
            SCHEDULER_WARN("Skipping snapshot entry without an id");
            continue;
        }

        auto it = m_companions.find(entry.id);
        if (it != m_companions.end()) {
            refreshCompanion(it->second, entry);
        } else {
            addCompanion(entry);
        }
    }
}

void CompanionScheduler::addCompanion(const CompanionSnapshot& snapshot) {
    if (!m_visualFactory) {
        SCHEDULER_ERROR("No visual factory set - cannot create companion " + snapshot.id);
        return;
    }

    std::unique_ptr<ICompanionVisual> visual = m_visualFactory(snapshot.id);
    if (!visual) {
        SCHEDULER_ERROR("Visual factory returned no visual for companion " + snapshot.id);
        return;
    }

    Companion companion;
    companion.visual = std::move(visual);
    companion.creationOrder = m_nextCreationOrder++;
    companion.state.id = snapshot.id;

    std::uniform_real_distribution<float> multiplierDist(
        CompanionConstants::SPEED_MULTIPLIER_MIN, CompanionConstants::SPEED_MULTIPLIER_MAX);
    companion.state.speedMultiplier = multiplierDist(m_rng);

    applySnapshotAttributes(companion, snapshot);

    const CompanionDisplaySettings settings = querySettings(snapshot.id);
    applySettingsTo(companion, settings);

    // Stored drag position wins over a random spawn point
    if (settings.storedPosition.has_value()) {
        companion.state.position = *settings.storedPosition;
    } else {
        const float lo = CompanionConstants::SPAWN_INSET;
        const float hi = std::max(lo, m_containerWidth - CompanionConstants::SPAWN_INSET);
        if (hi > lo) {
            std::uniform_real_distribution<float> spawnDist(lo, hi);
            companion.state.position = spawnDist(m_rng);
        } else {
            companion.state.position = lo;
        }
    }
    companion.state.position = std::clamp(companion.state.position, minPosition(),
                                          std::max(minPosition(), maxPosition(companion)));

    std::bernoulli_distribution headingDist(0.5);
    companion.state.direction = headingDist(m_rng) ? WalkDirection::Forward : WalkDirection::Backward;

    companion.visual->setPosition(companion.state.position);
    pickNewTarget(companion);
    updateWalking(companion);

    SCHEDULER_INFO(std::format("Added companion {} at x={:.1f} (stage '{}')",
                               snapshot.id, companion.state.position, companion.state.stage));

    m_companions.emplace(snapshot.id, std::move(companion));
}

void CompanionScheduler::removeCompanion(const std::string& id) {
    auto it = m_companions.find(id);
    if (it == m_companions.end()) {
        return;
    }

    it->second.visual->setWalking(false);
    m_companions.erase(it);
    SCHEDULER_INFO("Removed companion " + id);
}

void CompanionScheduler::refreshCompanion(Companion& companion, const CompanionSnapshot& snapshot) {
    applySnapshotAttributes(companion, snapshot);
    applySettingsTo(companion, querySettings(snapshot.id));
    // A scale change can push the right edge past the container
    clampIntoContainer(companion);
    updateWalking(companion);
}

void CompanionScheduler::applySnapshotAttributes(Companion& companion,
                                                 const CompanionSnapshot& snapshot) {
    CompanionState& state = companion.state;

    const bool spriteChanged = state.spritePath != snapshot.spritePath;
    state.scaleFactor = snapshot.scale;
    state.stage = snapshot.stage;
    state.defaultFacing = snapshot.defaultFacing;
    state.spritePath = snapshot.spritePath;

    // Only hit the asset loader when the reference actually changes
    if (spriteChanged) {
        loadSprite(companion);
    }

    updateSize(companion);
    updateOrientation(companion);
}

void CompanionScheduler::loadSprite(Companion& companion) {
    const std::string& path = companion.state.spritePath;
    if (path.empty()) {
        return;
    }

    // Asset failures stop here: the visual falls back to its placeholder fill
    try {
        if (!companion.visual->setSprite(path)) {
            SCHEDULER_WARN(std::format("Sprite '{}' unavailable for companion {} - using placeholder",
                                       path, companion.state.id));
        }
    } catch (const std::exception& e) {
        SCHEDULER_ERROR(std::format("Failed to load sprite '{}' for companion {}: {}",
                                    path, companion.state.id, e.what()));
    }
}

// ---------------------------------------------------------------------------
// Bounds and settings
// ---------------------------------------------------------------------------

void CompanionScheduler::setContainerWidth(float width) {
    m_containerWidth = width;
    for (auto& [id, companion] : m_companions) {
        clampIntoContainer(companion);
    }
}

void CompanionScheduler::clampIntoContainer(Companion& companion) {
    CompanionState& state = companion.state;
    const float lo = minPosition();
    const float hi = std::max(lo, maxPosition(companion));

    if (state.position >= lo && state.position <= hi) {
        return;
    }

    state.position = std::clamp(state.position, lo, hi);
    companion.visual->setPosition(state.position);

    if (!state.isResting && !state.isEgg()) {
        pickNewTarget(companion);
    }
}

float CompanionScheduler::calculateScreenScaleFactor(float screenWidth, float screenHeight) {
    const float referenceDiagonal = std::hypot(CompanionConstants::REFERENCE_SCREEN_WIDTH,
                                               CompanionConstants::REFERENCE_SCREEN_HEIGHT);
    const float currentDiagonal = std::hypot(screenWidth, screenHeight);
    return std::clamp(currentDiagonal / referenceDiagonal,
                      CompanionConstants::MIN_SCREEN_SCALE,
                      CompanionConstants::MAX_SCREEN_SCALE);
}

void CompanionScheduler::setScreenSize(float screenWidth, float screenHeight) {
    m_screenScaleFactor = calculateScreenScaleFactor(screenWidth, screenHeight);
    SCHEDULER_INFO(std::format("Screen size set: {:.0f}x{:.0f}, scale factor: {:.2f}",
                               screenWidth, screenHeight, m_screenScaleFactor));

    for (auto& [id, companion] : m_companions) {
        updateSize(companion);
        clampIntoContainer(companion);
    }
}

void CompanionScheduler::updateSize(Companion& companion) {
    const float effectiveScale = companion.state.scaleFactor *
                                 CompanionConstants::BASE_DISPLAY_MULTIPLIER *
                                 m_screenScaleFactor;
    const float size = std::round(CompanionConstants::BASE_SIZE * effectiveScale);
    companion.visual->setSize(size, size);
}

void CompanionScheduler::applySettings(const std::string& id,
                                       const CompanionDisplaySettings& settings) {
    auto it = m_companions.find(id);
    if (it == m_companions.end()) {
        SCHEDULER_DEBUG("applySettings for unknown companion " + id);
        return;
    }
    applySettingsTo(it->second, settings);
    updateWalking(it->second);
}

void CompanionScheduler::applySettingsTo(Companion& companion,
                                         const CompanionDisplaySettings& settings) {
    companion.state.movementEnabled = settings.movementEnabled;
    companion.state.baseSpeed = std::clamp(settings.movementSpeed,
                                           CompanionConstants::SPEED_MIN,
                                           CompanionConstants::SPEED_MAX);
}

CompanionDisplaySettings CompanionScheduler::querySettings(const std::string& id) const {
    if (!m_settingsGetter) {
        return CompanionDisplaySettings{};
    }
    return m_settingsGetter(id);
}

// ---------------------------------------------------------------------------
// Interaction
// ---------------------------------------------------------------------------

void CompanionScheduler::notifyExternalReposition(const std::string& id) {
    auto it = m_companions.find(id);
    if (it == m_companions.end()) {
        SCHEDULER_WARN("Reposition notice for unknown companion " + id);
        return;
    }

    Companion& companion = it->second;
    companion.state.position = companion.visual->getPosition();

    // Without a fresh target it would walk straight back to the old one
    if (!companion.state.isEgg() && !companion.state.isResting) {
        pickNewTarget(companion);
    }

    SCHEDULER_DEBUG(std::format("Companion {} repositioned to x={:.1f}", id,
                                companion.state.position));
}

std::optional<CompanionHit> CompanionScheduler::hitTest(float x, float y) const {
    auto ordered = inCreationOrder();
    for (auto it = ordered.rbegin(); it != ordered.rend(); ++it) {
        const Companion* companion = *it;
        if (companion->visual->containsPoint(x, y)) {
            return CompanionHit{companion->state.id, companion->visual};
        }
    }
    return std::nullopt;
}

std::vector<SDL_FRect> CompanionScheduler::getVisualBounds(float floorY) const {
    std::vector<SDL_FRect> bounds;
    bounds.reserve(m_companions.size());
    for (const auto& [id, companion] : m_companions) {
        const float width = companion.visual->getRenderedWidth();
        if (width <= 0.0f) {
            continue;
        }
        bounds.push_back(SDL_FRect{companion.visual->getPosition(), floorY - width, width, width});
    }
    return bounds;
}

// ---------------------------------------------------------------------------
// Per frame
// ---------------------------------------------------------------------------

void CompanionScheduler::tick(Uint64 nowMs) {
    if (!m_running) {
        return;
    }

    for (auto& [id, companion] : m_companions) {
        stepCompanion(companion, nowMs);
    }
}

void CompanionScheduler::stepCompanion(Companion& companion, Uint64 nowMs) {
    CompanionState& state = companion.state;

    // Eggs only play their animation
    if (state.isEgg()) {
        return;
    }

    if (m_paused || !state.movementEnabled || companion.visual->isDragged()) {
        return;
    }

    if (state.isResting) {
        if (nowMs >= state.restUntil) {
            state.isResting = false;
            pickNewTarget(companion);
            updateWalking(companion);
        }
        return;
    }

    const float speed = state.effectiveSpeed();
    state.position += speed * directionSign(state.direction);

    const float lo = minPosition();
    const float hi = std::max(lo, maxPosition(companion));

    if (state.position <= lo) {
        state.position = lo;
        startResting(companion, nowMs);
        pickNewTarget(companion);
    } else if (state.position >= hi) {
        state.position = hi;
        startResting(companion, nowMs);
        pickNewTarget(companion);
    } else if (std::fabs(state.position - state.targetPosition) < speed * 2.0f) {
        startResting(companion, nowMs);
    }

    companion.visual->setPosition(state.position);
}

void CompanionScheduler::pickNewTarget(Companion& companion) {
    CompanionState& state = companion.state;
    const float lo = minPosition();
    const float hi = std::max(lo, maxPosition(companion));
    const float span = hi - lo;

    float target = lo;
    if (span > 0.0f) {
        std::uniform_real_distribution<float> targetDist(lo, hi);
        // Narrow containers accept any draw so the loop always ends
        do {
            target = targetDist(m_rng);
        } while (std::fabs(target - state.position) < CompanionConstants::MIN_TARGET_DISTANCE &&
                 span > CompanionConstants::MIN_SPAN_FOR_DISTANCE_RULE);
    }

    state.targetPosition = target;
    state.direction = target > state.position ? WalkDirection::Forward : WalkDirection::Backward;
    updateOrientation(companion);
}

void CompanionScheduler::startResting(Companion& companion, Uint64 nowMs) {
    std::uniform_int_distribution<Uint64> restDist(m_config.restMinMs, m_config.restMaxMs - 1);
    companion.state.isResting = true;
    companion.state.restUntil = nowMs + restDist(m_rng);
    updateWalking(companion);
}

void CompanionScheduler::render(SDL_Renderer* renderer, float floorY) const {
    for (const Companion* companion : inCreationOrder()) {
        companion->visual->render(renderer, floorY);
    }
}

// ---------------------------------------------------------------------------
// Visual state
// ---------------------------------------------------------------------------

void CompanionScheduler::updateOrientation(Companion& companion) {
    companion.visual->setMirrored(
        needsMirror(companion.state.defaultFacing, companion.state.direction));
}

void CompanionScheduler::updateWalking(Companion& companion) {
    const CompanionState& state = companion.state;
    bool walking = m_running && !m_paused;
    if (walking && !state.isEgg()) {
        walking = state.movementEnabled && !state.isResting;
    }
    companion.visual->setWalking(walking);
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

float CompanionScheduler::renderedWidth(const Companion& companion) const {
    const float width = companion.visual->getRenderedWidth();
    return width > 0.0f ? width : CompanionConstants::BASE_SIZE;
}

float CompanionScheduler::maxPosition(const Companion& companion) const {
    return m_containerWidth - renderedWidth(companion) - m_config.edgeMargin;
}

bool CompanionScheduler::hasCompanion(const std::string& id) const {
    return m_companions.find(id) != m_companions.end();
}

const CompanionState* CompanionScheduler::getState(const std::string& id) const {
    auto it = m_companions.find(id);
    return it != m_companions.end() ? &it->second.state : nullptr;
}

std::vector<std::string> CompanionScheduler::getCompanionIds() const {
    std::vector<std::string> ids;
    ids.reserve(m_companions.size());
    for (const Companion* companion : inCreationOrder()) {
        ids.push_back(companion->state.id);
    }
    return ids;
}

std::vector<const CompanionScheduler::Companion*> CompanionScheduler::inCreationOrder() const {
    std::vector<const Companion*> ordered;
    ordered.reserve(m_companions.size());
    for (const auto& [id, companion] : m_companions) {
        ordered.push_back(&companion);
    }
    std::sort(ordered.begin(), ordered.end(), [](const Companion* a, const Companion* b) {
        return a->creationOrder < b->creationOrder;
    });
    return ordered;
}

} // namespace PetDock
