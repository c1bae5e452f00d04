/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SDL_HOTKEY_SERVICE_HPP
#define SDL_HOTKEY_SERVICE_HPP

#include "host/IHotkeyService.hpp"

#include <SDL3/SDL.h>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace PetDock {

/**
 * @brief Parsed key combination such as "CommandOrControl+Shift+O"
 */
struct HotkeyCombo {
    bool ctrl{false};
    bool shift{false};
    bool alt{false};
    bool gui{false};
    SDL_Keycode key{SDLK_UNKNOWN};

    [[nodiscard]] bool modifiersHeld(SDL_Keymod mod) const;
    bool operator==(const HotkeyCombo& other) const = default;
};

/**
 * @brief IHotkeyService fed from the SDL keyboard event stream
 *
 * SDL delivers key events only to the window holding keyboard focus, so a
 * combination fires only while that window is focused. Registration fails
 * when the focus check reports the window can never take focus.
 * Registration and unregistration complete inline. Pressed is reported on
 * every key-down of the combination's key with its modifiers held (key
 * repeat included); Released when that key goes up or a required modifier
 * is let go while the combination is down.
 */
class SDLHotkeyService : public IHotkeyService {
public:
    // True when the window that receives key events can take keyboard focus
    using FocusCheck = std::function<bool()>;

    explicit SDLHotkeyService(FocusCheck canTakeFocus = nullptr);
    ~SDLHotkeyService() override = default;

    void registerHotkey(const std::string& combination, HotkeyHandler handler,
                        CompletionCallback done) override;
    void unregisterHotkey(const std::string& combination, CompletionCallback done) override;

    /**
     * @brief Routes a keyboard event to matching registrations
     * @return true if the event belonged to a registered combination
     */
    bool handleEvent(const SDL_Event& event);

    /**
     * @brief Parses "Modifier+Modifier+Key", case-insensitive
     *
     * Modifiers: CommandOrControl (CmdOrCtrl), Control (Ctrl), Shift,
     * Alt (Option), Super (Command, Cmd, Meta). The key is a letter, a digit
     * or an SDL key name such as "Space" or "F5".
     *
     * @return std::nullopt if the string is empty, has no key, or names an
     *         unknown key or modifier
     */
    [[nodiscard]] static std::optional<HotkeyCombo> parseCombination(const std::string& combination);

    [[nodiscard]] bool isRegistered(const std::string& combination) const;
    [[nodiscard]] size_t getRegisteredCount() const { return m_registrations.size(); }

private:
    struct Registration {
        HotkeyCombo combo;
        HotkeyHandler handler;
        bool down{false};
    };

    FocusCheck m_canTakeFocus;
    std::unordered_map<std::string, Registration> m_registrations;
};

} // namespace PetDock

#endif // SDL_HOTKEY_SERVICE_HPP
