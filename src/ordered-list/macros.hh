#pragma once

// =========================================================================================================
// Toolchain and platform
// =========================================================================================================
// Exactly one of: OL_COMPILER_MSVC, OL_COMPILER_CLANG, OL_COMPILER_GCC, OL_COMPILER_MINGW
// Additionally OL_COMPILER_POSIX for the gcc-style front ends
// Exactly one of: OL_OS_WINDOWS, OL_OS_LINUX, OL_OS_APPLE, OL_OS_BSD

#if defined(_MSC_VER)
#define OL_COMPILER_MSVC
#elif defined(__clang__)
#define OL_COMPILER_CLANG
#elif defined(__GNUC__)
#define OL_COMPILER_GCC
#elif defined(__MINGW32__) || defined(__MINGW64__)
#define OL_COMPILER_MINGW
#else
#error "ordered-list: unsupported compiler"
#endif

#if !defined(OL_COMPILER_MSVC)
#define OL_COMPILER_POSIX
#endif

#if defined(_WIN32)
#define OL_OS_WINDOWS
#elif defined(__APPLE__)
#define OL_OS_APPLE
#elif defined(__linux__)
#define OL_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define OL_OS_BSD
#else
#error "ordered-list: unsupported platform"
#endif

// =========================================================================================================
// Build mode
// =========================================================================================================
// Set by CMakeLists.txt: OL_DEBUG, OL_RELEASE, OL_RELWITHDEBINFO, optionally OL_ENABLE_ASSERT_IN_RELEASE
// Derived here: OL_ASSERT_ENABLED (0 or 1)
//
// Consumers that include the headers without our CMake get no mode define and thus assertions.

#if defined(OL_RELEASE) && !defined(OL_ENABLE_ASSERT_IN_RELEASE)
#define OL_ASSERT_ENABLED 0
#else
#define OL_ASSERT_ENABLED 1
#endif

// =========================================================================================================
// Function and expression annotations
// =========================================================================================================

// OL_FORCE_INLINE - used by the tiny cast helpers in utility.hh
// OL_COLD_FUNC    - marks the assertion failure path
// OL_UNUSED(expr) - keeps a stripped OL_ASSERT argument compiling without evaluating it

#ifdef OL_COMPILER_MSVC
#define OL_FORCE_INLINE __forceinline
#define OL_COLD_FUNC
#else
// gcc needs the extra 'inline'
#define OL_FORCE_INLINE __attribute__((always_inline)) inline
#define OL_COLD_FUNC __attribute__((cold))
#endif

#define OL_UNUSED(expr) (void)(sizeof((expr)))
