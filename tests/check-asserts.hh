#pragma once

#include <stable-vec/assert-handler.hh>

#include <nexus/test.hh>

namespace sv::test
{
struct assertion_fired
{
};

/// Runs f with a handler that turns a failing assertion into an assertion_fired exception.
/// Returns true if an assertion failed.
template <class F>
bool fails_assertion(F&& f)
{
    auto handler = sv::impl::scoped_assertion_handler([](sv::impl::assertion_info const&) { throw assertion_fired{}; });
    try
    {
        f();
    }
    catch (assertion_fired const&)
    {
        return true;
    }
    return false;
}
} // namespace sv::test

// CHECKs that evaluating the expression fails an sv assertion
#define SV_CHECK_ASSERTS(...) CHECK(sv::test::fails_assertion([&] { (void)(__VA_ARGS__); }))
