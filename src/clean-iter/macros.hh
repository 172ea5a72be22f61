#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: CI_COMPILER_MSVC, CI_COMPILER_CLANG, CI_COMPILER_GCC, CI_COMPILER_MINGW, CI_COMPILER_POSIX

#if defined(_MSC_VER)
#define CI_COMPILER_MSVC
#elif defined(__clang__)
#define CI_COMPILER_CLANG
#elif defined(__GNUC__)
#define CI_COMPILER_GCC
#elif defined(__MINGW32__) || defined(__MINGW64__)
#define CI_COMPILER_MINGW
#else
#error "Unknown compiler"
#endif

#if defined(CI_COMPILER_CLANG) || defined(CI_COMPILER_GCC) || defined(CI_COMPILER_MINGW)
#define CI_COMPILER_POSIX
#endif

// =========================================================================================================
// Compilation modes
// =========================================================================================================
// Conditionally defined: CI_HAS_CPP_EXCEPTIONS
// From CMake: CI_DEBUG, CI_RELEASE, CI_RELWITHDEBINFO, CI_ENABLE_ASSERT_IN_RELEASE
// Always defined: CI_ASSERT_ENABLED (0 or 1)

#ifdef CI_COMPILER_MSVC
#ifdef _CPPUNWIND
#define CI_HAS_CPP_EXCEPTIONS
#endif
#elif defined(CI_COMPILER_CLANG)
#if __EXCEPTIONS && __has_feature(cxx_exceptions)
#define CI_HAS_CPP_EXCEPTIONS
#endif
#elif defined(CI_COMPILER_GCC)
#if __EXCEPTIONS
#define CI_HAS_CPP_EXCEPTIONS
#endif
#endif

// the iteration API reports invalid arguments and rejected mutations via exceptions
#ifndef CI_HAS_CPP_EXCEPTIONS
#error "clean-iter requires C++ exceptions to be enabled"
#endif

// assertions are active in debug and relwithdebinfo builds (and in builds that do not say anything)
// release builds strip them unless CI_ENABLE_ASSERT_IN_RELEASE is set
#if defined(CI_RELEASE) && !defined(CI_ENABLE_ASSERT_IN_RELEASE)
#define CI_ASSERT_ENABLED 0
#else
#define CI_ASSERT_ENABLED 1
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: CI_OS_WINDOWS, CI_OS_LINUX, CI_OS_APPLE, CI_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define CI_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__) || defined(macintosh)
#define CI_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define CI_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define CI_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// CI_FORCE_INLINE - Force function to be inlined
#define CI_FORCE_INLINE CI_IMPL_FORCE_INLINE

// CI_COLD_FUNC - Mark function as rarely executed (error paths, assertions, reallocation)
// Usage: CI_COLD_FUNC void handle_error() { ... }
#define CI_COLD_FUNC CI_IMPL_COLD_FUNC

// CI_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define CI_UNUSED(expr) (void)(sizeof((expr)))

// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(CI_COMPILER_MSVC)

#define CI_IMPL_FORCE_INLINE __forceinline
#define CI_IMPL_COLD_FUNC

#elif defined(CI_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define CI_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define CI_IMPL_COLD_FUNC __attribute__((cold))

#else
#error "Unknown compiler"
#endif
