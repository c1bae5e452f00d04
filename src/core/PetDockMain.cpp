/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/CompanionApp.hpp"
#include "core/Logger.hpp"

#include <exception>
#include <format>
#include <string>

// Shipped defaults; user overrides are read from the SDL pref path
const std::string DEFAULT_SETTINGS_PATH{"res/settings.json"};

// maybe_unused is just a hint to the compiler that the variable is not used.
// with -Wall -Wextra flags
int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
  PetDock::CompanionApp app;

  try {
    if (!app.init(DEFAULT_SETTINGS_PATH)) {
      APP_CRITICAL("Initialization failed");
      app.clean();
      return -1;
    }

    APP_INFO("Starting main loop");
    app.run();
  } catch (const std::exception& e) {
    APP_CRITICAL(std::format("Unhandled exception: {}", e.what()));
    app.clean();
    return -1;
  }

  APP_INFO("Shutting down");
  app.clean();
  return 0;
}
