#include "scope_id.hh"

#include <stable-vec/assert.hh>

#include <atomic>

namespace
{
std::atomic<sv::u64> g_next_scope_id{sv::impl::no_scope_id + 1};
}

sv::u64 sv::impl::acquire_scope_id()
{
    auto const id = g_next_scope_id.fetch_add(1, std::memory_order_relaxed);
    SV_ASSERT_ALWAYS(id != no_scope_id, "scope id counter wrapped around");
    return id;
}
