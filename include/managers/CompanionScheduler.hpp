/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMPANION_SCHEDULER_HPP
#define COMPANION_SCHEDULER_HPP

/**
 * @file CompanionScheduler.hpp
 * @brief Registry and per-tick motion of every visible companion
 *
 * Each companion performs a bounded 1-D random walk inside the surface:
 * walk to a random target, rest for 2-8 seconds, pick another target.
 * Companions in the "egg" stage keep animating in place and never move.
 *
 * The scheduler exclusively owns the CompanionState records and their
 * visual handles. Outside actors reach it through the InteractionBridge
 * (container width, committed drag) and the snapshot feed (reconcile).
 *
 * Usage:
 *   CompanionScheduler scheduler(config, makeVisual);
 *   scheduler.setSettingsGetter(store.makeSettingsGetter());
 *   scheduler.setContainerWidth(800.0f);
 *   scheduler.start();
 *   scheduler.reconcile(feed.poll());
 *   scheduler.tick(SDL_GetTicks());   // once per frame
 */

#include "entities/CompanionTypes.hpp"
#include "render/ICompanionVisual.hpp"

#include <SDL3/SDL_rect.h>
#include <SDL3/SDL_stdinc.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace PetDock {

struct SchedulerConfig {
    float edgeMargin{CompanionConstants::EDGE_MARGIN};
    Uint64 restMinMs{CompanionConstants::REST_MIN_MS};
    Uint64 restMaxMs{CompanionConstants::REST_MAX_MS};
    float initialContainerWidth{400.0f};
    uint32_t seed{0}; // 0 = seed from std::random_device
};

/**
 * @brief Result of a surface hit test against the companion visuals
 */
struct CompanionHit {
    std::string id;
    // Expires if the companion is torn down while the caller still holds it
    std::weak_ptr<ICompanionVisual> visual;
};

class CompanionScheduler {
public:
    using VisualFactory = std::function<std::unique_ptr<ICompanionVisual>(const std::string& id)>;
    using SettingsGetter = std::function<CompanionDisplaySettings(const std::string& id)>;

    CompanionScheduler(const SchedulerConfig& config, VisualFactory visualFactory);
    ~CompanionScheduler();

    CompanionScheduler(const CompanionScheduler&) = delete;
    CompanionScheduler& operator=(const CompanionScheduler&) = delete;

    // --- Lifecycle ---

    /**
     * @brief Starts animation playback; tick() advances motion from now on
     */
    void start();

    /**
     * @brief Halts animation playback; tick() becomes a no-op
     */
    void stop();

    /**
     * @brief Stops and releases every companion and its visual handle
     */
    void dispose();

    [[nodiscard]] bool isRunning() const { return m_running; }

    /**
     * @brief Suspends/resumes position updates for every companion
     */
    void togglePause();
    [[nodiscard]] bool isPaused() const { return m_paused; }

    // --- Snapshot feed ---

    /**
     * @brief Synchronizes the registry against the companions that should exist
     *
     * Ids absent from the snapshot are torn down, new ids are created at a
     * random position and heading, existing ids have scale, sprite, stage,
     * facing and settings refreshed in place. Running it twice with the same
     * snapshot changes nothing the second time.
     */
    void reconcile(const std::vector<CompanionSnapshot>& snapshot);

    // --- Bounds and settings ---

    /**
     * @brief Updates the bounding width and clamps companions into it
     */
    void setContainerWidth(float width);
    [[nodiscard]] float getContainerWidth() const { return m_containerWidth; }

    /**
     * @brief Recomputes the screen scale factor and resizes every companion
     */
    void setScreenSize(float screenWidth, float screenHeight);
    [[nodiscard]] float getScreenScaleFactor() const { return m_screenScaleFactor; }

    /**
     * @brief Per-companion override of movement and speed
     * @note Unknown ids are ignored
     */
    void applySettings(const std::string& id, const CompanionDisplaySettings& settings);

    /**
     * @brief Sets the getter queried at creation and on refresh
     */
    void setSettingsGetter(SettingsGetter getter) { m_settingsGetter = std::move(getter); }

    // --- Interaction ---

    /**
     * @brief Commits a position set directly on a visual by an outside actor
     *
     * Reads the position back from the visual handle and, unless the
     * companion is an egg or resting, picks a new walk target from there.
     */
    void notifyExternalReposition(const std::string& id);

    /**
     * @brief Finds the topmost companion under a surface-local point
     */
    [[nodiscard]] std::optional<CompanionHit> hitTest(float x, float y) const;

    /**
     * @brief Screen area each companion occupies when standing on floorY
     *
     * Sprites are square, so each rectangle is rendered width by rendered
     * width. Companions not laid out yet are left out.
     */
    [[nodiscard]] std::vector<SDL_FRect> getVisualBounds(float floorY) const;

    // --- Per frame ---

    /**
     * @brief Advances every eligible companion by one step
     * @param nowMs Current time in milliseconds
     */
    void tick(Uint64 nowMs);

    /**
     * @brief Draws every companion in creation order
     */
    void render(SDL_Renderer* renderer, float floorY) const;

    // --- Queries ---

    [[nodiscard]] size_t getCompanionCount() const { return m_companions.size(); }
    [[nodiscard]] bool hasCompanion(const std::string& id) const;

    /**
     * @brief Read-only view of a companion's committed state
     * @return nullptr if the id is not live
     */
    [[nodiscard]] const CompanionState* getState(const std::string& id) const;

    [[nodiscard]] std::vector<std::string> getCompanionIds() const;

    /**
     * @brief Ratio of the screen diagonal to 1920x1080, clamped to [0.75, 1.5]
     */
    [[nodiscard]] static float calculateScreenScaleFactor(float screenWidth, float screenHeight);

private:
    struct Companion {
        CompanionState state;
        std::shared_ptr<ICompanionVisual> visual;
        uint64_t creationOrder{0};
    };

    void addCompanion(const CompanionSnapshot& snapshot);
    void removeCompanion(const std::string& id);
    void refreshCompanion(Companion& companion, const CompanionSnapshot& snapshot);
    void applySnapshotAttributes(Companion& companion, const CompanionSnapshot& snapshot);
    void applySettingsTo(Companion& companion, const CompanionDisplaySettings& settings);
    CompanionDisplaySettings querySettings(const std::string& id) const;

    void stepCompanion(Companion& companion, Uint64 nowMs);
    void pickNewTarget(Companion& companion);
    void startResting(Companion& companion, Uint64 nowMs);
    void clampIntoContainer(Companion& companion);

    void updateSize(Companion& companion);
    void updateOrientation(Companion& companion);
    void updateWalking(Companion& companion);
    void loadSprite(Companion& companion);

    [[nodiscard]] float renderedWidth(const Companion& companion) const;
    [[nodiscard]] float minPosition() const { return m_config.edgeMargin; }
    [[nodiscard]] float maxPosition(const Companion& companion) const;
    [[nodiscard]] std::vector<const Companion*> inCreationOrder() const;

    SchedulerConfig m_config;
    VisualFactory m_visualFactory;
    SettingsGetter m_settingsGetter;

    std::unordered_map<std::string, Companion> m_companions;
    uint64_t m_nextCreationOrder{0};

    float m_containerWidth{400.0f};
    float m_screenScaleFactor{1.0f};
    bool m_running{false};
    bool m_paused{false};

    std::mt19937 m_rng;
};

} // namespace PetDock

#endif // COMPANION_SCHEDULER_HPP
