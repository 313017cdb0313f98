#pragma once
#ifndef TALLY_API
#if defined(_WIN32) || defined(__CYGWIN__)
#define TALLY_PLATFORM_WINDOWS 1
#else
#define TALLY_PLATFORM_WINDOWS 0
#endif
#if TALLY_PLATFORM_WINDOWS
#if defined(TALLY_BUILD_SHARED)
#define TALLY_API __declspec(dllexport)
#elif defined(TALLY_SHARED)
#define TALLY_API __declspec(dllimport)
#else
#define TALLY_API
#endif
#else
#if defined(TALLY_BUILD_SHARED) || defined(TALLY_SHARED)
#if __GNUC__ >= 4
#define TALLY_API __attribute__((visibility("default")))
#else
#define TALLY_API
#endif // __GNUC__
#else
#define TALLY_API
#endif // TALLY_BUILD_SHARED || TALLY_SHARED
#endif // TALLY_PLATFORM_WINDOWS
#endif // TALLY_API
