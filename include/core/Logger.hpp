/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - cstdint: Required for uint8_t type
// - mutex: Required for thread-safe logging
// - atomic: Required for std::atomic<bool> quiet mode flag
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> quiet mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace PetDock {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (even in release for crashes)
  ERROR_LEVEL = 1,  // Renamed to avoid macro conflicts
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Full console logging in debug builds
class Logger {
private:
  static std::atomic<bool> s_quietMode;
  static std::mutex s_logMutex;

public:
  static void SetQuietMode(bool enabled) {
    s_quietMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsQuietMode() {
    return s_quietMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_quietMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("PetDock - [%s] %s: %s\n", system, getLevelString(level), message);
    fflush(stdout);
  }

private:
  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }
};

#define PETDOCK_CRITICAL(system, msg)                                          \
  PetDock::Logger::Log(PetDock::LogLevel::CRITICAL, system, msg)
#define PETDOCK_ERROR(system, msg)                                             \
  PetDock::Logger::Log(PetDock::LogLevel::ERROR_LEVEL, system, msg)
#define PETDOCK_WARN(system, msg)                                              \
  PetDock::Logger::Log(PetDock::LogLevel::WARNING, system, msg)
#define PETDOCK_INFO(system, msg)                                              \
  PetDock::Logger::Log(PetDock::LogLevel::INFO, system, msg)
#define PETDOCK_DEBUG(system, msg)                                             \
  PetDock::Logger::Log(PetDock::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - CRITICAL and ERROR go to a log file, the rest compiles away
class Logger {
private:
  static std::atomic<bool> s_quietMode;

public:
  static std::mutex s_logMutex; // Public for macro access

  static void SetQuietMode(bool enabled) {
    s_quietMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsQuietMode() {
    return s_quietMode.load(std::memory_order_relaxed);
  }

  // Defined in Logger.cpp (file sink)
  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define PETDOCK_CRITICAL(system, msg)                                          \
  PetDock::Logger::Log("CRITICAL", system, msg)

#define PETDOCK_ERROR(system, msg) PetDock::Logger::Log("ERROR", system, msg)

#define PETDOCK_WARN(system, msg) ((void)0)  // Zero overhead
#define PETDOCK_INFO(system, msg) ((void)0)  // Zero overhead
#define PETDOCK_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_quietMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each subsystem

// Core Systems
#define APP_CRITICAL(msg) PETDOCK_CRITICAL("CompanionApp", msg)
#define APP_ERROR(msg) PETDOCK_ERROR("CompanionApp", msg)
#define APP_WARN(msg) PETDOCK_WARN("CompanionApp", msg)
#define APP_INFO(msg) PETDOCK_INFO("CompanionApp", msg)
#define APP_DEBUG(msg) PETDOCK_DEBUG("CompanionApp", msg)

#define TIMER_CRITICAL(msg) PETDOCK_CRITICAL("FrameTimerQueue", msg)
#define TIMER_ERROR(msg) PETDOCK_ERROR("FrameTimerQueue", msg)
#define TIMER_WARN(msg) PETDOCK_WARN("FrameTimerQueue", msg)
#define TIMER_INFO(msg) PETDOCK_INFO("FrameTimerQueue", msg)
#define TIMER_DEBUG(msg) PETDOCK_DEBUG("FrameTimerQueue", msg)

// Animation
#define SCHEDULER_CRITICAL(msg) PETDOCK_CRITICAL("CompanionScheduler", msg)
#define SCHEDULER_ERROR(msg) PETDOCK_ERROR("CompanionScheduler", msg)
#define SCHEDULER_WARN(msg) PETDOCK_WARN("CompanionScheduler", msg)
#define SCHEDULER_INFO(msg) PETDOCK_INFO("CompanionScheduler", msg)
#define SCHEDULER_DEBUG(msg) PETDOCK_DEBUG("CompanionScheduler", msg)

#define SPRITE_CRITICAL(msg) PETDOCK_CRITICAL("SpriteCache", msg)
#define SPRITE_ERROR(msg) PETDOCK_ERROR("SpriteCache", msg)
#define SPRITE_WARN(msg) PETDOCK_WARN("SpriteCache", msg)
#define SPRITE_INFO(msg) PETDOCK_INFO("SpriteCache", msg)
#define SPRITE_DEBUG(msg) PETDOCK_DEBUG("SpriteCache", msg)

#define SNAPSHOT_CRITICAL(msg) PETDOCK_CRITICAL("SnapshotFeed", msg)
#define SNAPSHOT_ERROR(msg) PETDOCK_ERROR("SnapshotFeed", msg)
#define SNAPSHOT_WARN(msg) PETDOCK_WARN("SnapshotFeed", msg)
#define SNAPSHOT_INFO(msg) PETDOCK_INFO("SnapshotFeed", msg)
#define SNAPSHOT_DEBUG(msg) PETDOCK_DEBUG("SnapshotFeed", msg)

// Interaction
#define INTERACTION_CRITICAL(msg) PETDOCK_CRITICAL("InteractionController", msg)
#define INTERACTION_ERROR(msg) PETDOCK_ERROR("InteractionController", msg)
#define INTERACTION_WARN(msg) PETDOCK_WARN("InteractionController", msg)
#define INTERACTION_INFO(msg) PETDOCK_INFO("InteractionController", msg)
#define INTERACTION_DEBUG(msg) PETDOCK_DEBUG("InteractionController", msg)

// Host adapters
#define GEOMETRY_CRITICAL(msg) PETDOCK_CRITICAL("WindowGateway", msg)
#define GEOMETRY_ERROR(msg) PETDOCK_ERROR("WindowGateway", msg)
#define GEOMETRY_WARN(msg) PETDOCK_WARN("WindowGateway", msg)
#define GEOMETRY_INFO(msg) PETDOCK_INFO("WindowGateway", msg)
#define GEOMETRY_DEBUG(msg) PETDOCK_DEBUG("WindowGateway", msg)

#define HOTKEY_CRITICAL(msg) PETDOCK_CRITICAL("HotkeyService", msg)
#define HOTKEY_ERROR(msg) PETDOCK_ERROR("HotkeyService", msg)
#define HOTKEY_WARN(msg) PETDOCK_WARN("HotkeyService", msg)
#define HOTKEY_INFO(msg) PETDOCK_INFO("HotkeyService", msg)
#define HOTKEY_DEBUG(msg) PETDOCK_DEBUG("HotkeyService", msg)

#define SURFACE_CRITICAL(msg) PETDOCK_CRITICAL("Surface", msg)
#define SURFACE_ERROR(msg) PETDOCK_ERROR("Surface", msg)
#define SURFACE_WARN(msg) PETDOCK_WARN("Surface", msg)
#define SURFACE_INFO(msg) PETDOCK_INFO("Surface", msg)
#define SURFACE_DEBUG(msg) PETDOCK_DEBUG("Surface", msg)

// Configuration
#define SETTINGS_CRITICAL(msg) PETDOCK_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) PETDOCK_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) PETDOCK_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) PETDOCK_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) PETDOCK_DEBUG("SettingsManager", msg)

// Quiet mode convenience macros
#define PETDOCK_ENABLE_QUIET_MODE() PetDock::Logger::SetQuietMode(true)
#define PETDOCK_DISABLE_QUIET_MODE() PetDock::Logger::SetQuietMode(false)

} // namespace PetDock

#endif // LOGGER_HPP
