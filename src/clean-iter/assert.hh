#pragma once

// Lean header with minimal dependencies, included by every container and engine header.
#include <clean-iter/macros.hh>
#include <clean-iter/source_location.hh>

// =========================================================================================================
// CI_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime; on failure calls the active assertion handler,
// then breaks into an attached debugger and aborts.
//
// When assertions are active:
//   Enabled unless CI_RELEASE is defined without CI_ENABLE_ASSERT_IN_RELEASE (see macros.hh).
//
// What assertions are for in clean-iter:
//   Preconditions of the building blocks: index bounds of vector/span, value() on an empty optional,
//   calling an invalid function_ref, capacity preconditions of the _stable append functions.
//
// What assertions are NOT for:
//   Everything a caller of the iteration API can get wrong at runtime.
//   A null source, a non-positive chunk size or a mutation of an immutable source are reported
//   with ci::invalid_argument_error / ci::unsupported_operation_error (see errors.hh).
//
// Usage:
//   CI_ASSERT(0 <= i && i < size(), "index out of bounds");
//   CI_ASSERT(has_capacity_back_for(1), "not enough capacity for push_back_stable");
//
#define CI_ASSERT(cond, msg) CI_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// CI_ASSERT_ALWAYS - Always-active assertion
//
// Like CI_ASSERT but remains active in all build configurations, including release builds.
//
#define CI_ASSERT_ALWAYS(cond, msg) CI_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// CI_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
//
#define CI_DEBUG_BREAK() CI_IMPL_DEBUG_BREAK()

// =========================================================================================================
// CI_BREAK_AND_ABORT - Debug break followed by program termination
//
#define CI_BREAK_AND_ABORT() (CI_DEBUG_BREAK(), ::ci::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace ci::impl
{
// Called when an assertion fails
// Forwards to the topmost assertion handler, or prints diagnostic information to stderr
// Note: does not abort, caller must follow with CI_BREAK_AND_ABORT()
CI_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, ci::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace ci::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef CI_COMPILER_MSVC

#define CI_IMPL_DEBUG_BREAK() (::ci::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(CI_COMPILER_POSIX)

// SIGTRAP is 5, declared here to avoid pulling in <csignal>
extern "C" int raise(int) noexcept;
#define CI_IMPL_DEBUG_BREAK() (::ci::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define CI_IMPL_DEBUG_BREAK() void(0)

#endif

#define CI_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::ci::impl::handle_assert_failure(#cond, msg, ::ci::source_location::current()); \
            CI_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if CI_ASSERT_ENABLED

#define CI_IMPL_ASSERT(cond, msg) CI_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the expressions must still compile
#define CI_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        CI_UNUSED(cond);          \
        CI_UNUSED(msg);           \
    } while (false)

#endif
