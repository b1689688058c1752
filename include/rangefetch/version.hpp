/*
 * Version header for rangefetch
 *
 * The build system passes RANGEFETCH_VERSION_STRING (from the CMake project
 * version) as a compile definition; the fallback keeps ad-hoc builds working.
 */

#pragma once

#ifndef RANGEFETCH_VERSION_STRING
#define RANGEFETCH_VERSION_STRING "0.0.0+dev"
#endif

#ifndef RANGEFETCH_BUILD_DATE
#define RANGEFETCH_BUILD_DATE __DATE__ " " __TIME__
#endif

namespace rangefetch {
inline constexpr const char* kVersionString = RANGEFETCH_VERSION_STRING;
inline constexpr const char* kVersionLongString =
    RANGEFETCH_VERSION_STRING " (built: " RANGEFETCH_BUILD_DATE ")";
} // namespace rangefetch
