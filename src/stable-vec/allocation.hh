#pragma once

#include <stable-vec/fwd.hh>
#include <stable-vec/utility.hh>

#include <new>

// Raw aligned memory for the slot storage of stable_vector<T>.
//
// Slot storage is a single byte block holding next_index() slots of sizeof(T) bytes each.
// Objects are only alive at occupied slots, so the block is never treated as an array of live T.
//
// Allocation failure is not recoverable: allocate_bytes asserts (always-on) and aborts.
// Deallocation takes the same size and alignment that were used for allocation.

namespace sv::impl
{
/// Minimum alignment of every slot block.
/// Slot blocks of distinct containers never share a cache line.
constexpr isize min_alloc_alignment = std::hardware_destructive_interference_size;

/// Allocates `bytes` bytes aligned to `alignment`.
/// bytes == 0 returns nullptr.
/// Failure is fatal.
[[nodiscard]] byte* allocate_bytes(isize bytes, isize alignment);

/// Releases a block obtained from allocate_bytes with the same bytes and alignment.
/// nullptr is a no-op.
void deallocate_bytes(byte* p, isize bytes, isize alignment);

/// Alignment used for slot blocks of T.
template <class T>
[[nodiscard]] constexpr isize slot_alignment_for()
{
    return sv::max(isize(alignof(T)), min_alloc_alignment);
}

/// Next slot capacity when a container needs room for at least `min_capacity` slots.
/// Doubles the current capacity to keep push_back amortized O(1).
[[nodiscard]] constexpr isize grow_capacity_for(isize curr_capacity, isize min_capacity)
{
    return sv::max(sv::max(curr_capacity << 1, min_capacity), isize(4));
}
} // namespace sv::impl
