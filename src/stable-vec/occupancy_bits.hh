#pragma once

#include <stable-vec/fwd.hh>

#include <vector>

/// Growable bitset recording which slots of a stable_vector hold a live element.
///
/// Bit i is set iff slot i is occupied.
/// Bits are packed into 64-bit words; bits at positions >= size() are always zero,
/// which lets count() and the find_* scans work on whole words without masking.
///
/// The find_* functions are the building blocks for element iteration (skip empty slots),
/// pop_back (last occupied slot) and compaction (next hole, next survivor).
struct sv::occupancy_bits
{
    static constexpr isize bits_per_word = 64;

    // queries
public:
    /// Number of tracked slots (occupied or not).
    [[nodiscard]] isize size() const { return _size; }
    [[nodiscard]] bool empty() const { return _size == 0; }

    /// Returns true if slot i is occupied.
    /// Precondition: 0 <= i < size().
    [[nodiscard]] bool test(isize i) const;

    /// Number of occupied slots (popcount over all words).
    [[nodiscard]] isize count() const;

    /// Smallest set index >= from, or size() if there is none.
    /// from may be anywhere in [0, size()].
    [[nodiscard]] isize find_next_set(isize from) const;

    /// Smallest unset index >= from, or size() if there is none.
    [[nodiscard]] isize find_next_unset(isize from) const;

    /// Largest set index < before, or -1 if there is none.
    /// before may be anywhere in [0, size()].
    [[nodiscard]] isize find_prev_set(isize before) const;

    // modifiers
public:
    void set(isize i);
    void reset(isize i);

    /// Appends one slot with the given state.
    void push_back(bool occupied);

    /// Drops all slots at positions >= new_size.
    /// Precondition: 0 <= new_size <= size().
    void truncate(isize new_size);

    void reserve(isize bit_capacity);
    void clear();

    // members
private:
    std::vector<u64> _words;
    isize _size = 0;
};
