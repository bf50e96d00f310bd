#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: ORDO_COMPILER_MSVC, ORDO_COMPILER_CLANG, ORDO_COMPILER_GCC, ORDO_COMPILER_POSIX

#if defined(_MSC_VER)
#define ORDO_COMPILER_MSVC
#elif defined(__clang__)
#define ORDO_COMPILER_CLANG
#elif defined(__GNUC__)
#define ORDO_COMPILER_GCC
#else
#error "Unknown compiler"
#endif

#if defined(ORDO_COMPILER_CLANG) || defined(ORDO_COMPILER_GCC)
#define ORDO_COMPILER_POSIX
#endif

// =========================================================================================================
// Build configuration
// =========================================================================================================
// From CMake: ORDO_DEBUG, ORDO_RELEASE, ORDO_RELWITHDEBINFO
// Optional:   ORDO_ENABLE_ASSERT_IN_RELEASE
//
// ORDO_ASSERT_ENABLED is 1 when ORDO_ASSERT checks are compiled in.
// Builds that do not name a configuration (e.g. a plain compiler invocation) keep assertions on.

#ifndef ORDO_ASSERT_ENABLED
#if defined(ORDO_RELEASE) && !defined(ORDO_ENABLE_ASSERT_IN_RELEASE)
#define ORDO_ASSERT_ENABLED 0
#else
#define ORDO_ASSERT_ENABLED 1
#endif
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// ORDO_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
// Usage: ORDO_COLD_FUNC void handle_error() { ... }
#define ORDO_COLD_FUNC ORDO_IMPL_COLD_FUNC

// ORDO_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define ORDO_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(ORDO_COMPILER_MSVC)

#define ORDO_IMPL_COLD_FUNC

#elif defined(ORDO_COMPILER_POSIX)

#define ORDO_IMPL_COLD_FUNC __attribute__((cold))

#endif
