#pragma once

#include <cstddef>
#include <cstdint>


namespace sv
{

//
// Primitives
//

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// generic bytes
using byte = std::byte;

// signed size and slot index type
// Slot indices, element counts and capacities are all isize.
// Negative values never name a slot and are rejected by assertions.
using isize = i64;

//
// Values
//

struct nullopt_t;
template <class T>
struct optional;

//
// Containers
//

struct occupancy_bits;

template <class T>
struct stable_vector;

//
// Scopes
//

/// Tag used by stable_vector<T>::jail() when the caller does not name one.
/// All guards opened with the default tag share one token type, so their tokens are only
/// told apart by the runtime scope id.
struct default_scope_tag;

template <class ScopeTag>
struct jailed_index;

template <class T, class ScopeTag>
struct jailed_stable_vector;

} // namespace sv
