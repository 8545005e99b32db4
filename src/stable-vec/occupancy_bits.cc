#include "occupancy_bits.hh"

#include <stable-vec/assertf.hh>

#include <bit>

namespace
{
constexpr sv::isize word_of(sv::isize i) { return i >> 6; }
constexpr sv::u64 mask_of(sv::isize i) { return sv::u64(1) << (i & 63); }

// mask with the lowest n bits set, n in [0, 64]
constexpr sv::u64 low_bits(sv::isize n) { return n >= 64 ? ~sv::u64(0) : (sv::u64(1) << n) - 1; }
} // namespace

bool sv::occupancy_bits::test(isize i) const
{
    SV_ASSERTF(0 <= i && i < _size, "slot {} out of bounds (size: {})", i, _size);
    return (_words[word_of(i)] & mask_of(i)) != 0;
}

sv::isize sv::occupancy_bits::count() const
{
    isize c = 0;
    for (auto const w : _words)
        c += std::popcount(w);
    return c;
}

sv::isize sv::occupancy_bits::find_next_set(isize from) const
{
    SV_ASSERTF(0 <= from && from <= _size, "scan start {} out of bounds (size: {})", from, _size);
    if (from == _size)
        return _size;

    auto wi = word_of(from);
    auto w = _words[wi] & ~low_bits(from & 63);
    auto const word_count = isize(_words.size());
    while (true)
    {
        if (w != 0)
            return wi * bits_per_word + std::countr_zero(w);

        if (++wi == word_count)
            return _size;
        w = _words[wi];
    }
}

sv::isize sv::occupancy_bits::find_next_unset(isize from) const
{
    SV_ASSERTF(0 <= from && from <= _size, "scan start {} out of bounds (size: {})", from, _size);
    if (from == _size)
        return _size;

    auto wi = word_of(from);
    // treat the already scanned low bits as set
    auto w = _words[wi] | low_bits(from & 63);
    auto const word_count = isize(_words.size());
    while (true)
    {
        if (w != ~u64(0))
        {
            auto const i = wi * bits_per_word + std::countr_one(w);
            // the zero padding above size() reads as unset
            return i < _size ? i : _size;
        }

        if (++wi == word_count)
            return _size;
        w = _words[wi];
    }
}

sv::isize sv::occupancy_bits::find_prev_set(isize before) const
{
    SV_ASSERTF(0 <= before && before <= _size, "scan end {} out of bounds (size: {})", before, _size);
    if (before == 0)
        return -1;

    auto wi = word_of(before - 1);
    auto w = _words[wi] & low_bits(((before - 1) & 63) + 1);
    while (true)
    {
        if (w != 0)
            return wi * bits_per_word + (bits_per_word - 1 - std::countl_zero(w));

        if (wi == 0)
            return -1;
        w = _words[--wi];
    }
}

void sv::occupancy_bits::set(isize i)
{
    SV_ASSERTF(0 <= i && i < _size, "slot {} out of bounds (size: {})", i, _size);
    _words[word_of(i)] |= mask_of(i);
}

void sv::occupancy_bits::reset(isize i)
{
    SV_ASSERTF(0 <= i && i < _size, "slot {} out of bounds (size: {})", i, _size);
    _words[word_of(i)] &= ~mask_of(i);
}

void sv::occupancy_bits::push_back(bool occupied)
{
    if ((_size & 63) == 0)
        _words.push_back(0);

    if (occupied)
        _words.back() |= mask_of(_size);

    ++_size;
}

void sv::occupancy_bits::truncate(isize new_size)
{
    SV_ASSERTF(0 <= new_size && new_size <= _size, "cannot truncate {} bits to {}", _size, new_size);

    _words.resize((new_size + bits_per_word - 1) / bits_per_word);
    if (!_words.empty())
        _words.back() &= low_bits(new_size - (isize(_words.size()) - 1) * bits_per_word);

    _size = new_size;
}

void sv::occupancy_bits::reserve(isize bit_capacity)
{
    SV_ASSERT(bit_capacity >= 0, "capacity must be non-negative");
    _words.reserve((bit_capacity + bits_per_word - 1) / bits_per_word);
}

void sv::occupancy_bits::clear()
{
    _words.clear();
    _size = 0;
}
