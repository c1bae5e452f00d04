/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE LoggerTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"

#include <string>

using namespace PetDock;

BOOST_AUTO_TEST_CASE(TestQuietModeToggles) {
    BOOST_CHECK(!Logger::IsQuietMode());

    PETDOCK_ENABLE_QUIET_MODE();
    BOOST_CHECK(Logger::IsQuietMode());
    // Silenced at every level
    APP_CRITICAL("critical while quiet");
    SCHEDULER_ERROR(std::string("error while quiet"));

    PETDOCK_DISABLE_QUIET_MODE();
    BOOST_CHECK(!Logger::IsQuietMode());
}

BOOST_AUTO_TEST_CASE(TestSubsystemMacrosAcceptBothStringKinds) {
    PETDOCK_ENABLE_QUIET_MODE();
    HOTKEY_WARN("plain literal");
    SURFACE_INFO(std::string("std::string message"));
    TIMER_DEBUG("debug message");
    PETDOCK_DISABLE_QUIET_MODE();
    BOOST_CHECK(!Logger::IsQuietMode());
}
