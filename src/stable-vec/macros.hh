#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: SV_COMPILER_MSVC, SV_COMPILER_CLANG, SV_COMPILER_GCC, SV_COMPILER_MINGW, SV_COMPILER_POSIX

#if defined(_MSC_VER)
#define SV_COMPILER_MSVC
#elif defined(__clang__)
#define SV_COMPILER_CLANG
#elif defined(__GNUC__)
#define SV_COMPILER_GCC
#elif defined(__MINGW32__) || defined(__MINGW64__)
#define SV_COMPILER_MINGW
#else
#error "Unknown compiler"
#endif

#if defined(SV_COMPILER_CLANG) || defined(SV_COMPILER_GCC) || defined(SV_COMPILER_MINGW)
#define SV_COMPILER_POSIX
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: SV_OS_WINDOWS, SV_OS_LINUX, SV_OS_APPLE, SV_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define SV_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__) || defined(macintosh)
#define SV_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define SV_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define SV_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Build configuration
// =========================================================================================================
// From CMake: SV_DEBUG, SV_RELEASE, SV_RELWITHDEBINFO
// Optional:   SV_ENABLE_ASSERT_IN_RELEASE
// Derived:    SV_ASSERT_ENABLED (0 or 1)
//
// SV_ASSERT / SV_ASSERTF are active whenever SV_ASSERT_ENABLED is 1.
// The _ALWAYS variants ignore this switch, which is what the scope checks of jailed_stable_vector use.

#ifndef SV_ASSERT_ENABLED
#if defined(SV_RELEASE) && !defined(SV_ENABLE_ASSERT_IN_RELEASE)
#define SV_ASSERT_ENABLED 0
#else
#define SV_ASSERT_ENABLED 1
#endif
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// SV_FORCE_INLINE - Force function to be inlined
#define SV_FORCE_INLINE SV_IMPL_FORCE_INLINE

// SV_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
// Usage: SV_COLD_FUNC void handle_error() { ... }
#define SV_COLD_FUNC SV_IMPL_COLD_FUNC

// SV_MACRO_JOIN(a, b) - Concatenate two tokens after expanding both
#define SV_MACRO_JOIN(arg1, arg2) SV_IMPL_MACRO_JOIN(arg1, arg2)

// SV_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define SV_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(SV_COMPILER_MSVC)

#define SV_IMPL_FORCE_INLINE __forceinline
#define SV_IMPL_COLD_FUNC

#elif defined(SV_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define SV_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define SV_IMPL_COLD_FUNC __attribute__((cold))

#else
#error "Unknown compiler"
#endif

#define SV_IMPL_MACRO_JOIN_INNER(arg1, arg2) arg1##arg2
#define SV_IMPL_MACRO_JOIN(arg1, arg2) SV_IMPL_MACRO_JOIN_INNER(arg1, arg2)
