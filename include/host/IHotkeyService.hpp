/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IHOTKEY_SERVICE_HPP
#define IHOTKEY_SERVICE_HPP

#include <cstdint>
#include <functional>
#include <string>

namespace PetDock {

enum class HotkeyState : uint8_t { Pressed, Released };

/**
 * @brief Registration of a single global key combination
 *
 * Pressed may repeat while the combination is held (key repeat).
 * Registration results are delivered asynchronously.
 */
class IHotkeyService {
public:
    using HotkeyHandler = std::function<void(HotkeyState)>;
    using CompletionCallback = std::function<void(bool success)>;

    virtual ~IHotkeyService() = default;

    virtual void registerHotkey(const std::string& combination, HotkeyHandler handler,
                                CompletionCallback done) = 0;

    virtual void unregisterHotkey(const std::string& combination, CompletionCallback done) = 0;
};

} // namespace PetDock

#endif // IHOTKEY_SERVICE_HPP
