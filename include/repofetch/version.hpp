/*
 * Version macros for repofetch.
 *
 * The build passes REPOFETCH_VERSION_STRING (from the CMake project version);
 * the defaults below only apply to builds that do not.
 */

#pragma once

#ifndef REPOFETCH_VERSION_MAJOR
#define REPOFETCH_VERSION_MAJOR 0
#endif

#ifndef REPOFETCH_VERSION_MINOR
#define REPOFETCH_VERSION_MINOR 1
#endif

#ifndef REPOFETCH_VERSION_PATCH
#define REPOFETCH_VERSION_PATCH 0
#endif

#ifndef REPOFETCH_VERSION_STRING
#define REPOFETCH_VERSION_STRING "0.1.0+dev"
#endif

#ifndef REPOFETCH_USER_AGENT
#define REPOFETCH_USER_AGENT "repofetch/" REPOFETCH_VERSION_STRING
#endif
