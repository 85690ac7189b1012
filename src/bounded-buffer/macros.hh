#pragma once

// =========================================================================================================
// Platform
// =========================================================================================================
//
// BB_COMPILER_MSVC   - MSVC (IsDebuggerPresent, __debugbreak)
// BB_COMPILER_POSIX  - gcc, clang or mingw (attributes, raise(SIGTRAP))
// BB_OS_WINDOWS      - _aligned_malloc / _aligned_free
// BB_OS_LINUX        - debugger detection via /proc/self/status
//
// Every other platform takes the posix_memalign path and reports "no debugger attached".

#if defined(_MSC_VER)
#define BB_COMPILER_MSVC
#elif defined(__GNUC__) || defined(__clang__)
#define BB_COMPILER_POSIX
#else
#error "unsupported compiler"
#endif

#if defined(_WIN32)
#define BB_OS_WINDOWS
#elif defined(__linux__)
#define BB_OS_LINUX
#endif

// =========================================================================================================
// Function attributes
// =========================================================================================================

#ifdef BB_COMPILER_MSVC
#define BB_FORCE_INLINE __forceinline
#define BB_COLD_FUNC
#else
// 'inline' is needed on gcc for always_inline on non-template functions
#define BB_FORCE_INLINE __attribute__((always_inline)) inline
#define BB_COLD_FUNC __attribute__((cold))
#endif

// BB_UNUSED(expr) - marks expr as used without evaluating it (sizeof is an unevaluated context)
// Used to keep stripped assertions compiling and to silence unused parameters.
#define BB_UNUSED(expr) (void)(sizeof((expr)))
