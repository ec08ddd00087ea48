#pragma once

// Build/version info.
//
// CMake defines TERMWORLD_VERSION to the project version string.
// Builds without CMake report "dev".

#ifndef TERMWORLD_VERSION
#define TERMWORLD_VERSION "dev"
#endif

#ifndef TERMWORLD_APPNAME
#define TERMWORLD_APPNAME "TermWorld"
#endif
