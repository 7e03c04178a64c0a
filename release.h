/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef RELEASE_H
#define RELEASE_H

#include <string>

#define APP_LAUNCHER_VERSION_MAJOR 0
#define APP_LAUNCHER_VERSION_MINOR 3
#define APP_LAUNCHER_VERSION_PATCH 0
#define APP_LAUNCHER_VERSION_TWEAK 0

#define AL__STRINGIFY(x) #x
#define AL_STRINGIFY(x) AL__STRINGIFY(x)

#define APP_LAUNCHER_VERSION_STRING \
AL_STRINGIFY(APP_LAUNCHER_VERSION_MAJOR) "." \
    AL_STRINGIFY(APP_LAUNCHER_VERSION_MINOR) "." \
    AL_STRINGIFY(APP_LAUNCHER_VERSION_PATCH) "." \
    AL_STRINGIFY(APP_LAUNCHER_VERSION_TWEAK)

const std::string g_version_datetime = "20251205";

const std::string g_version = std::string("version ") + std::string(APP_LAUNCHER_VERSION_STRING) + " - " + g_version_datetime;

#endif // RELEASE_H
