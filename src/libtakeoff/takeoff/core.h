// =====================================================================
//  src/libtakeoff/takeoff/core.h — Library initialization and export macros
// =====================================================================
//
//  Part of libtakeoff.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef TAKEOFF_CORE_H
#define TAKEOFF_CORE_H

// ---- Export macro ----------------------------------------------------
//
// When building libtakeoff as a shared library, TAKEOFF_SHARED and
// TAKEOFF_BUILDING are defined.  Consumers linking against the shared
// library only see TAKEOFF_SHARED (set as a PUBLIC compile definition).

#if defined(TAKEOFF_SHARED)
  #if defined(TAKEOFF_BUILDING)
    #if defined(_WIN32)
      #define TAKEOFF_EXPORT __declspec(dllexport)
    #else
      #define TAKEOFF_EXPORT __attribute__((visibility("default")))
    #endif
  #else
    #if defined(_WIN32)
      #define TAKEOFF_EXPORT __declspec(dllimport)
    #else
      #define TAKEOFF_EXPORT
    #endif
  #endif
#else
  #define TAKEOFF_EXPORT
#endif

namespace takeoff {

/// Library version string (e.g., "0.3.0").
TAKEOFF_EXPORT const char* version();

/// Initialize library-wide state (logging filter rules).
/// Call once at application startup before using other functions.
/// @param verbose Enable debug output for all takeoff.* categories
/// Returns true on success.
TAKEOFF_EXPORT bool initialize(bool verbose = false);

/// Shut down the library and release resources.
/// Call once at application exit.
TAKEOFF_EXPORT void shutdown();

}  // namespace takeoff

#endif  // TAKEOFF_CORE_H
