#pragma once

#include <stable-vec/fwd.hh>

namespace sv::impl
{
/// Scope id meaning "not held by any jailed_stable_vector".
constexpr u64 no_scope_id = 0;

/// Returns a process-wide unique scope id, never no_scope_id.
/// Ids increase monotonically, so a reopened scope never sees ids of an earlier one.
[[nodiscard]] u64 acquire_scope_id();
} // namespace sv::impl
