/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "host/SDLHotkeyService.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>
#include <vector>

namespace PetDock {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

std::optional<SDL_Keycode> parseKey(const std::string& token) {
    if (token.size() == 1) {
        const unsigned char c = static_cast<unsigned char>(token[0]);
        // SDL3 letter keycodes are the lowercase ASCII codes
        if (std::isalpha(c)) {
            return static_cast<SDL_Keycode>(std::tolower(c));
        }
        if (std::isdigit(c)) {
            return static_cast<SDL_Keycode>(c);
        }
    }

    const SDL_Keycode key = SDL_GetKeyFromName(token.c_str());
    if (key == SDLK_UNKNOWN) {
        return std::nullopt;
    }
    return key;
}

} // namespace

bool HotkeyCombo::modifiersHeld(SDL_Keymod mod) const {
    return (!ctrl || (mod & SDL_KMOD_CTRL) != 0) &&
           (!shift || (mod & SDL_KMOD_SHIFT) != 0) &&
           (!alt || (mod & SDL_KMOD_ALT) != 0) &&
           (!gui || (mod & SDL_KMOD_GUI) != 0);
}

SDLHotkeyService::SDLHotkeyService(FocusCheck canTakeFocus)
    : m_canTakeFocus(std::move(canTakeFocus)) {}

std::optional<HotkeyCombo> SDLHotkeyService::parseCombination(const std::string& combination) {
    std::vector<std::string> tokens;
    std::stringstream stream(combination);
    std::string token;
    while (std::getline(stream, token, '+')) {
        tokens.push_back(trim(token));
    }
    // getline drops the empty token after a trailing '+'
    if (!combination.empty() && combination.back() == '+') {
        tokens.emplace_back();
    }
    if (tokens.empty()) {
        return std::nullopt;
    }

    HotkeyCombo combo;
    for (size_t i = 0; i + 1 < tokens.size(); ++i) {
        const std::string modifier = toLower(tokens[i]);
        if (modifier == "commandorcontrol" || modifier == "cmdorctrl") {
#ifdef SDL_PLATFORM_APPLE
            combo.gui = true;
#else
            combo.ctrl = true;
#endif
        } else if (modifier == "control" || modifier == "ctrl") {
            combo.ctrl = true;
        } else if (modifier == "shift") {
            combo.shift = true;
        } else if (modifier == "alt" || modifier == "option") {
            combo.alt = true;
        } else if (modifier == "super" || modifier == "command" || modifier == "cmd" ||
                   modifier == "meta") {
            combo.gui = true;
        } else {
            return std::nullopt;
        }
    }

    const std::string& keyToken = tokens.back();
    if (keyToken.empty()) {
        return std::nullopt;
    }
    auto key = parseKey(keyToken);
    if (!key) {
        return std::nullopt;
    }
    combo.key = *key;
    return combo;
}

void SDLHotkeyService::registerHotkey(const std::string& combination, HotkeyHandler handler,
                                      CompletionCallback done) {
    auto combo = parseCombination(combination);
    if (!combo) {
        HOTKEY_ERROR("Cannot parse hotkey combination '" + combination + "'");
        if (done) {
            done(false);
        }
        return;
    }
    if (!handler) {
        HOTKEY_ERROR("No handler for hotkey '" + combination + "'");
        if (done) {
            done(false);
        }
        return;
    }

    if (m_canTakeFocus && !m_canTakeFocus()) {
        HOTKEY_ERROR("Hotkey '" + combination + "' can never fire: the window cannot take keyboard focus");
        if (done) {
            done(false);
        }
        return;
    }

    m_registrations[combination] = Registration{*combo, std::move(handler), false};
    HOTKEY_INFO("Hotkey registered: " + combination + " (active while the window has keyboard focus)");
    if (done) {
        done(true);
    }
}

void SDLHotkeyService::unregisterHotkey(const std::string& combination, CompletionCallback done) {
    const bool removed = m_registrations.erase(combination) > 0;
    if (!removed) {
        HOTKEY_WARN("Hotkey was not registered: " + combination);
    }
    if (done) {
        done(removed);
    }
}

bool SDLHotkeyService::isRegistered(const std::string& combination) const {
    return m_registrations.contains(combination);
}

bool SDLHotkeyService::handleEvent(const SDL_Event& event) {
    if (event.type != SDL_EVENT_KEY_DOWN && event.type != SDL_EVENT_KEY_UP) {
        return false;
    }

    const bool keyDown = event.type == SDL_EVENT_KEY_DOWN;
    const SDL_Keycode key = event.key.key;
    const SDL_Keymod mod = event.key.mod;

    // Handlers may unregister, so collect first and invoke afterwards
    std::vector<std::pair<HotkeyHandler, HotkeyState>> pending;
    bool consumed = false;

    for (auto& [combination, registration] : m_registrations) {
        const HotkeyCombo& combo = registration.combo;
        if (keyDown && key == combo.key && combo.modifiersHeld(mod)) {
            registration.down = true;
            pending.emplace_back(registration.handler, HotkeyState::Pressed);
            consumed = true;
        } else if (registration.down && (key == combo.key || !combo.modifiersHeld(mod))) {
            // Key up of the main key, or a required modifier let go
            registration.down = false;
            pending.emplace_back(registration.handler, HotkeyState::Released);
            consumed = true;
        }
    }

    for (auto& [handler, state] : pending) {
        handler(state);
    }
    return consumed;
}

} // namespace PetDock
