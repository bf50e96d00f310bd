#pragma once

// Lean header: only macros and a source location, so the container headers can include it freely.
#include <ordo/macros.hh>

#include <source_location>

// =========================================================================================================
// ORDO_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime and reports through the assertion handler stack on failure.
// Without a custom handler the failure is printed to stderr and the program aborts.
//
// When assertions are active:
//   Enabled in ORDO_DEBUG and ORDO_RELWITHDEBINFO builds (and builds that name no configuration).
//   In ORDO_RELEASE builds, assertions are disabled unless ORDO_ENABLE_ASSERT_IN_RELEASE is defined.
//
// What assertions are for in ordo:
//   - preconditions of the container API (non-empty front/back, positive slice step, ...)
//   - the value store / position ledger invariants after structural changes
//   - cursors resumed against a map that was mutated in between
//
// What assertions are NOT for:
//   - missing keys in lookups: those are regular outcomes (nullptr, nullopt, default value)
//     or an ordo::key_not_found_error for the checked operations
//
// Usage:
//   ORDO_ASSERT(!empty(), "front() on an empty map");
//   ORDO_ASSERT(step > 0, "slice step must be positive");
//
#define ORDO_ASSERT(cond, msg) ORDO_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// ORDO_ASSERT_ALWAYS - Always-active assertion
//
// Like ORDO_ASSERT but remains active in all build configurations, including release builds.
//
#define ORDO_ASSERT_ALWAYS(cond, msg) ORDO_IMPL_ASSERT_ALWAYS(cond, msg)


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace ordo::impl
{
// Called when an assertion fails
// Dispatches to the topmost handler (or the default stderr handler)
// Note: does not abort, the macro follows up with perform_abort()
ORDO_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, std::source_location location);

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace ordo::impl

#define ORDO_IMPL_ASSERT_ALWAYS(cond, msg)                                                       \
    do                                                                                           \
    {                                                                                            \
        if (!(cond)) [[unlikely]]                                                                \
        {                                                                                        \
            ::ordo::impl::handle_assert_failure(#cond, msg, ::std::source_location::current()); \
            ::ordo::impl::perform_abort();                                                       \
        }                                                                                        \
    } while (false)

#if ORDO_ASSERT_ENABLED

#define ORDO_IMPL_ASSERT(cond, msg) ORDO_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the condition and message still have to compile
#define ORDO_IMPL_ASSERT(cond, msg) \
    do                              \
    {                               \
        ORDO_UNUSED(cond);          \
        ORDO_UNUSED(msg);           \
    } while (false)

#endif
