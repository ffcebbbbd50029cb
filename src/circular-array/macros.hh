#pragma once

//
// Toolchain detection
//
// CA_COMPILER_MSVC or CA_COMPILER_POSIX (gcc, clang, mingw)
// CA_OS_LINUX when /proc is available for debugger detection

#if defined(_MSC_VER) && !defined(__clang__)
#define CA_COMPILER_MSVC
#elif defined(__GNUC__) || defined(__clang__)
#define CA_COMPILER_POSIX
#else
#error "unsupported compiler"
#endif

#if defined(__linux__)
#define CA_OS_LINUX
#endif

//
// Build configuration
//
// CMake defines one of CA_DEBUG, CA_RELWITHDEBINFO, CA_RELEASE.
// CA_ASSERT_ENABLED is always 0 or 1 after this header:
//   1 in debug and relwithdebinfo builds
//   1 in release builds only with CA_ENABLE_ASSERT_IN_RELEASE
// Defining CA_ASSERT_ENABLED up front overrides both.

#ifndef CA_ASSERT_ENABLED
#if defined(CA_RELEASE) && !defined(CA_ENABLE_ASSERT_IN_RELEASE)
#define CA_ASSERT_ENABLED 0
#else
#define CA_ASSERT_ENABLED 1
#endif
#endif

//
// Helpers
//

// marks failure paths so the optimizer moves them out of hot loops
#ifdef CA_COMPILER_MSVC
#define CA_COLD_FUNC
#else
#define CA_COLD_FUNC __attribute__((cold))
#endif

// type-checks expr without evaluating it
#define CA_UNUSED(expr) (void)(sizeof((expr)))
