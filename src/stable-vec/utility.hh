#pragma once

#include <stable-vec/assert.hh>
#include <stable-vec/fwd.hh>

#include <new>
#include <type_traits>

// =========================================================================================================
// Utility functions used throughout the containers
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   exchange(obj, new_val)      - replace obj with new_val and return old value
//
// Comparison:
//   max(a, b)                   - returns the larger of two values (requires operator<)
//
// Alignment (value or pointer):
//   is_power_of_two(value)      - check if value is a power of 2
//
// Object lifetime:
//   placement_new               - tag for the non-allocating placement new below
//   storage_for<T>              - uninitialized, correctly aligned storage for exactly one T
//


namespace sv
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

template <class T>
[[nodiscard]] SV_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] SV_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] SV_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Replace object with new value and return the old value
/// Usage:
///   auto data = sv::exchange(rhs._data, nullptr); // steal a buffer in a move constructor
template <class T, class U = T>
[[nodiscard]] SV_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = forward<U>(new_val);
    return old_val;
}

// =========================================================================================================
// Comparison
// =========================================================================================================

/// Returns the larger of two values using operator<
/// When a == b, max returns b
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter)
}

// =========================================================================================================
// Alignment
// =========================================================================================================

/// Check if a positive value is a power of two
/// Preconditions:
///   value > 0
template <class T>
[[nodiscard]] constexpr bool is_power_of_two(T value)
{
    SV_ASSERT(value > 0, "is_power_of_two: value must be positive");
    return (value & (value - 1)) == 0;
}

// =========================================================================================================
// Object lifetime
// =========================================================================================================

/// Tag selecting the non-allocating placement new declared at the end of this header.
/// Usage:
///   new (sv::placement_new, slot_ptr) T(sv::move(value));
struct placement_new_t
{
};
constexpr placement_new_t placement_new = {};

/// Storage for exactly one T whose lifetime is managed by hand.
/// Never constructs or destroys the value on its own.
template <class T>
union storage_for
{
    T value;

    storage_for() {}

    ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    ~storage_for() {}

    storage_for(storage_for const&) = default;
    storage_for& operator=(storage_for const&) = default;
};

} // namespace sv

[[nodiscard]] SV_FORCE_INLINE void* operator new(std::size_t, sv::placement_new_t, void* buffer) noexcept
{
    return buffer;
}
SV_FORCE_INLINE void operator delete(void*, sv::placement_new_t, void*) noexcept {}
