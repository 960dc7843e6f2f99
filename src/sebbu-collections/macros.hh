#pragma once

// =========================================================================================================
// Toolchain
// =========================================================================================================
// SC_COMPILER_MSVC or SC_COMPILER_POSIX (gcc and clang), SC_OS_LINUX where /proc is available

#if defined(_MSC_VER)
#define SC_COMPILER_MSVC
#elif defined(__GNUC__) || defined(__clang__)
#define SC_COMPILER_POSIX
#else
#error "sebbu-collections supports msvc, gcc and clang"
#endif

#if defined(__linux__)
#define SC_OS_LINUX
#endif

// =========================================================================================================
// Contract checks
// =========================================================================================================
// CMake defines one of SC_DEBUG, SC_RELWITHDEBINFO, SC_RELEASE.
// SC_ASSERT_ENABLED is 1 unless this is a plain release build without SC_ENABLE_ASSERT_IN_RELEASE.

#if defined(SC_RELEASE) && !defined(SC_ENABLE_ASSERT_IN_RELEASE)
#define SC_ASSERT_ENABLED 0
#else
#define SC_ASSERT_ENABLED 1
#endif

// =========================================================================================================
// Attributes and helpers
// =========================================================================================================

#if defined(SC_COMPILER_MSVC)
#define SC_FORCE_INLINE __forceinline
#define SC_COLD_FUNC
#else
// gcc wants the extra inline next to always_inline
#define SC_FORCE_INLINE __attribute__((always_inline)) inline
#define SC_COLD_FUNC __attribute__((cold))
#endif

// token pasting after macro expansion, e.g. SC_MACRO_JOIN(_slot_, __COUNTER__)
#define SC_MACRO_JOIN(a, b) SC_IMPL_MACRO_JOIN(a, b)
#define SC_IMPL_MACRO_JOIN(a, b) a##b

// type-checks expr without evaluating it
#define SC_UNUSED(expr) (void)sizeof((expr))
