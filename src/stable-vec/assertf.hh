#pragma once

#include <stable-vec/assert.hh>

#include <format>
#include <string>

// =========================================================================================================
// SV_ASSERTF - Runtime assertion with formatted message
//
// Formatted version of SV_ASSERT, supporting std::format-style arguments.
// Arguments are only evaluated when the assertion fails.
//
// Usage:
//   SV_ASSERTF(index < next_index(), "slot {} out of bounds (next_index: {})", index, next_index());
//
#define SV_ASSERTF(cond, msg, ...) SV_IMPL_ASSERTF(cond, msg, ##__VA_ARGS__)

// =========================================================================================================
// SV_ASSERTF_ALWAYS - Always-active assertion with formatted message
//
// Usage:
//   SV_ASSERTF_ALWAYS(idx._scope == _scope, "index of scope {} used in scope {}", idx._scope, _scope);
//
#define SV_ASSERTF_ALWAYS(cond, msg, ...) SV_IMPL_ASSERTF_ALWAYS(cond, msg, ##__VA_ARGS__)


// =========================================================================================================
// Implementation details
// =========================================================================================================

#define SV_IMPL_ASSERTF_ALWAYS(cond, msg, ...)                                                            \
    do                                                                                                    \
    {                                                                                                     \
        if (!(cond)) [[unlikely]]                                                                         \
        {                                                                                                 \
            ::sv::impl::handle_assert_failure(#cond, std::format(msg __VA_OPT__(, ) __VA_ARGS__).c_str(), \
                                              ::sv::source_location::current());                          \
            SV_BREAK_AND_ABORT();                                                                         \
        }                                                                                                 \
    } while (false)

#if SV_ASSERT_ENABLED

#define SV_IMPL_ASSERTF(cond, msg, ...) SV_IMPL_ASSERTF_ALWAYS(cond, msg, ##__VA_ARGS__)

#else

// stripped, but the format string still has to compile against its arguments
#define SV_IMPL_ASSERTF(cond, msg, ...)                         \
    do                                                          \
    {                                                           \
        SV_UNUSED(cond);                                        \
        SV_UNUSED(std::format(msg __VA_OPT__(, ) __VA_ARGS__)); \
    } while (false)

#endif
