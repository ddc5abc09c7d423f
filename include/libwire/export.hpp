#pragma once

/// @file export.hpp
/// Cross-platform shared-library symbol visibility macro.
///
/// Build-system defines (set automatically by CMake):
///   LIBWIRE_BUILDING  — defined when compiling the libwire library itself
///   LIBWIRE_STATIC    — define when building/linking libwire as a static lib

#if defined(LIBWIRE_STATIC)
  #define LIBWIRE_EXPORT
#elif defined(_WIN32) || defined(__CYGWIN__)
  #ifdef LIBWIRE_BUILDING
    #define LIBWIRE_EXPORT __declspec(dllexport)
  #else
    #define LIBWIRE_EXPORT __declspec(dllimport)
  #endif
#elif defined(__GNUC__) || defined(__clang__)
  #define LIBWIRE_EXPORT __attribute__((visibility("default")))
#else
  #define LIBWIRE_EXPORT
#endif
