#pragma once

// =========================================================================================================
// Toolchain
// =========================================================================================================
// VD_COMPILER_MSVC or VD_COMPILER_POSIX (gcc, clang, mingw)
// VD_HAS_RTTI if typeid is usable (needed for type names in unsupported_default_type)

#if defined(_MSC_VER)
#define VD_COMPILER_MSVC
#elif defined(__clang__) || defined(__GNUC__) || defined(__MINGW32__) || defined(__MINGW64__)
#define VD_COMPILER_POSIX
#else
#error "verdict: unsupported compiler"
#endif

#if defined(VD_COMPILER_MSVC) ? defined(_CPPRTTI) : defined(__GXX_RTTI)
#define VD_HAS_RTTI
#endif

// unwrap, expect and unwrap_or_default throw, so there is no exception-free build
#if defined(VD_COMPILER_MSVC) ? !defined(_CPPUNWIND) : !defined(__EXCEPTIONS)
#error "verdict must be compiled with exception support"
#endif

// =========================================================================================================
// Build configuration
// =========================================================================================================
// CMake defines one of VD_DEBUG, VD_RELEASE, VD_RELWITHDEBINFO.
// VD_ASSERT_ENABLED is always defined (0 or 1): off in VD_RELEASE unless VD_ENABLE_ASSERT_IN_RELEASE.

#ifndef VD_ASSERT_ENABLED
#if defined(VD_RELEASE) && !defined(VD_ENABLE_ASSERT_IN_RELEASE)
#define VD_ASSERT_ENABLED 0
#else
#define VD_ASSERT_ENABLED 1
#endif
#endif

// =========================================================================================================
// Attributes
// =========================================================================================================

#ifdef VD_COMPILER_MSVC
#define VD_FORCE_INLINE __forceinline
#define VD_COLD_FUNC
#else
// 'inline' is required in addition on gcc
#define VD_FORCE_INLINE __attribute__((always_inline)) inline
// throwing unwraps and assertion reports
#define VD_COLD_FUNC __attribute__((cold))
#endif

// type-checks expr without evaluating it
#define VD_UNUSED(expr) (void)(sizeof((expr)))
