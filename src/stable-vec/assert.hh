#pragma once

// Lean header with minimal dependencies, included by every container header.
// For formatted messages, use <stable-vec/assertf.hh> instead.
#include <stable-vec/macros.hh>
#include <stable-vec/source_location.hh>

// =========================================================================================================
// SV_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime and triggers a debugger break + abort on failure.
//
// When assertions are active:
//   SV_ASSERT is enabled unless SV_RELEASE is defined (see SV_ASSERT_ENABLED in macros.hh).
//   SV_ENABLE_ASSERT_IN_RELEASE keeps it enabled in release builds.
//
// What assertions are for:
//   Assertions protect INVARIANTS, PRECONDITIONS, and POSTCONDITIONS.
//   In this library that includes every misuse of a jailed_index: presenting it to a scope that did
//   not mint it, or looking it up after its element was removed.
//
// Error handling strategy:
//   - Assertions      -> programmer errors, violated invariants/preconditions/postconditions
//   - optional<T>     -> expected absence (popping an empty container, removing an empty slot)
//
// Important:
//   Assertions can be semantically equivalent to std::terminate().
//   Production builds can install a custom assertion handler (see assert-handler.hh).
//
// Usage:
//   SV_ASSERT(index >= 0, "slot index must be non-negative");
//   SV_ASSERT(!is_jailed(), "container is held by a jailed_stable_vector");
//
#define SV_ASSERT(cond, msg) SV_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// SV_ASSERT_ALWAYS - Always-active assertion
//
// Like SV_ASSERT but remains active in all build configurations, including release builds.
// Used for checks whose failure would otherwise read unrelated data or corrupt memory.
//
// Usage:
//   SV_ASSERT_ALWAYS(has_element_at(index), "slot is empty");
//
#define SV_ASSERT_ALWAYS(cond, msg) SV_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// SV_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
//
#define SV_DEBUG_BREAK() SV_IMPL_DEBUG_BREAK()

// =========================================================================================================
// SV_BREAK_AND_ABORT - Debug break followed by program termination
//
#define SV_BREAK_AND_ABORT() (SV_DEBUG_BREAK(), ::sv::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace sv::impl
{
// Called when an assertion fails
// Dispatches to the topmost assertion handler or prints diagnostics to stderr
// Note: does not abort, caller must follow with SV_BREAK_AND_ABORT()
SV_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, sv::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace sv::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef SV_COMPILER_MSVC

#define SV_IMPL_DEBUG_BREAK() (::sv::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(SV_COMPILER_POSIX)

// SIGTRAP is 5 according to https://man7.org/linux/man-pages/man7/signal.7.html
// raise is declared by hand to keep posix headers out of every translation unit
extern "C" int raise(int) noexcept;
#define SV_IMPL_DEBUG_BREAK() (::sv::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define SV_IMPL_DEBUG_BREAK() void(0)

#endif

#define SV_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::sv::impl::handle_assert_failure(#cond, msg, ::sv::source_location::current()); \
            SV_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if SV_ASSERT_ENABLED

#define SV_IMPL_ASSERT(cond, msg) SV_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the condition and message still have to compile
#define SV_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        SV_UNUSED(cond);          \
        SV_UNUSED(msg);           \
    } while (false)

#endif
