#pragma once

#include <stable-vec/allocation.hh>
#include <stable-vec/assertf.hh>
#include <stable-vec/fwd.hh>
#include <stable-vec/occupancy_bits.hh>
#include <stable-vec/optional.hh>
#include <stable-vec/scope_id.hh>
#include <stable-vec/utility.hh>

#include <initializer_list>
#include <iterator>
#include <type_traits>
#include <vector>


namespace sv::impl
{
template <class T, bool IsConst>
struct stable_vector_iterator;

struct stable_vector_index_iterator;
struct stable_vector_index_range;
} // namespace sv::impl

/// Growable sequence of T where every element keeps its slot index until it is removed.
///
/// push_back returns the slot index of the new element. That index keeps naming the same element
/// while other elements are pushed or removed. Removal leaves an empty slot (a tombstone) behind
/// instead of shifting later elements down.
///
/// Slot indices are only invalidated by compaction (make_compact, reordering_make_compact),
/// which closes the holes and renumbers survivors, and by clear/into_vector.
/// Slot numbers are never reused in between: push_back always appends at next_index(),
/// and removals never lower next_index(). A removed index therefore always names an empty slot.
///
/// To hand out indices that cannot outlive the next compaction, use jail()
/// (see <stable-vec/jailed_stable_vector.hh>). While a jailed_stable_vector holds the container,
/// every mutating member of stable_vector asserts.
///
/// Storage layout:
///   one aligned byte block with capacity() slots of sizeof(T) bytes
///   occupancy_bits with next_index() bits, bit i set iff slot i holds a live T
///
/// Lifetime:
///   a T is alive exactly at occupied slots
///   growth move-constructs the live elements into a new block (slot positions are kept)
///   any growth invalidates pointers and references (but never slot indices)
template <class T>
struct sv::stable_vector
{
    static_assert(!std::is_reference_v<T>, "stable_vector cannot hold references");
    static_assert(std::is_nothrow_destructible_v<T>, "T must be nothrow destructible");

    using iterator = impl::stable_vector_iterator<T, false>;
    using const_iterator = impl::stable_vector_iterator<T, true>;

    // element access
public:
    /// Returns the element at slot i.
    /// Precondition: has_element_at(i).
    [[nodiscard]] T& operator[](isize i)
    {
        SV_ASSERTF(has_element_at(i), "no element at slot {} (next_index: {})", i, next_index());
        return *impl_slot(i);
    }
    [[nodiscard]] T const& operator[](isize i) const
    {
        SV_ASSERTF(has_element_at(i), "no element at slot {} (next_index: {})", i, next_index());
        return *impl_slot(i);
    }

    /// Returns a pointer to the element at slot i, or nullptr if the slot is empty or out of range.
    [[nodiscard]] T* get(isize i) { return has_element_at(i) ? impl_slot(i) : nullptr; }
    [[nodiscard]] T const* get(isize i) const { return has_element_at(i) ? impl_slot(i) : nullptr; }

    /// True if i is a valid slot index currently holding an element.
    /// Any i is allowed, including negative values.
    [[nodiscard]] bool has_element_at(isize i) const { return 0 <= i && i < next_index() && _occupied.test(i); }

    /// Linear search for an element equal to value.
    [[nodiscard]] bool contains(T const& value) const
        requires requires(T const& v) { bool(v == v); }
    {
        for (auto const& e : *this)
            if (e == value)
                return true;
        return false;
    }

    // iteration
public:
    /// Iterates the live elements in slot order, skipping empty slots.
    [[nodiscard]] iterator begin() { return iterator(this, _occupied.find_next_set(0)); }
    [[nodiscard]] iterator end() { return iterator(this, next_index()); }
    [[nodiscard]] const_iterator begin() const { return const_iterator(this, _occupied.find_next_set(0)); }
    [[nodiscard]] const_iterator end() const { return const_iterator(this, next_index()); }

    /// Range over the slot indices of all live elements, in increasing order.
    /// Usage:
    ///   for (isize i : v.indices())
    ///       use(i, v[i]);
    [[nodiscard]] impl::stable_vector_index_range indices() const;

    // queries
public:
    /// Number of live elements.
    [[nodiscard]] isize num_elements() const { return _num_elements; }
    [[nodiscard]] bool empty() const { return _num_elements == 0; }

    /// Slot index the next push_back will return.
    /// Also the number of slots, occupied or empty.
    [[nodiscard]] isize next_index() const { return _occupied.size(); }

    /// Number of slots that fit into the current allocation.
    [[nodiscard]] isize capacity() const { return _capacity; }

    /// True if there are no empty slots, i.e. next_index() == num_elements().
    [[nodiscard]] bool is_compact() const { return _num_elements == next_index(); }

    /// True while a jailed_stable_vector holds this container.
    [[nodiscard]] bool is_jailed() const { return _scope != impl::no_scope_id; }

    /// Occupancy of all slots.
    [[nodiscard]] occupancy_bits const& occupancy() const { return _occupied; }

    // factories
public:
    [[nodiscard]] static stable_vector create_with_capacity(isize capacity)
    {
        stable_vector v;
        v.reserve(capacity);
        return v;
    }

    /// Elements end up in slots 0 .. values.size()-1, in order.
    [[nodiscard]] static stable_vector create_copy_of(std::initializer_list<T> values)
        requires std::is_copy_constructible_v<T>
    {
        auto v = create_with_capacity(isize(values.size()));
        for (auto const& e : values)
            v.impl_emplace_back(e);
        return v;
    }

    // modifiers
public:
    /// Appends an element and returns its slot index (always the previous next_index()).
    isize push_back(T const& value) { return emplace_back(value); }
    isize push_back(T&& value) { return emplace_back(sv::move(value)); }

    template <class... Args>
    isize emplace_back(Args&&... args)
    {
        impl_assert_not_jailed();
        return impl_emplace_back(sv::forward<Args>(args)...);
    }

    /// Removes the element with the highest slot index and returns it.
    /// Leaves an empty slot behind; next_index() does not change.
    /// Returns nullopt if there is no element.
    optional<T> pop_back()
    {
        impl_assert_not_jailed();
        return impl_pop_back();
    }

    /// Removes the element at slot i and returns it, or nullopt if slot i is already empty.
    /// Precondition: 0 <= i < next_index().
    optional<T> pop_at(isize i)
    {
        impl_assert_not_jailed();
        return impl_pop_at(i);
    }

    /// Destroys the element at slot i.
    /// Returns false if slot i was already empty.
    /// Precondition: 0 <= i < next_index().
    bool remove_at(isize i)
    {
        impl_assert_not_jailed();
        SV_ASSERTF(0 <= i && i < next_index(), "slot {} out of bounds (next_index: {})", i, next_index());

        if (!_occupied.test(i))
            return false;

        impl_slot(i)->~T();
        _occupied.reset(i);
        --_num_elements;
        return true;
    }

    /// Removes every element for which pred(element) is false.
    /// Surviving elements keep their slot indices.
    template <class Pred>
    void retain(Pred&& pred)
    {
        impl_assert_not_jailed();

        for (auto i = _occupied.find_next_set(0); i < next_index(); i = _occupied.find_next_set(i + 1))
        {
            if (!pred(*impl_slot(i)))
            {
                impl_slot(i)->~T();
                _occupied.reset(i);
                --_num_elements;
            }
        }
    }

    /// Destroys all elements and resets next_index() to 0.
    /// Keeps the allocation.
    void clear()
    {
        impl_assert_not_jailed();
        impl_destroy_all();
        _occupied.clear();
        _num_elements = 0;
    }

    /// Ensures that capacity() >= capacity.
    /// Never invalidates slot indices.
    void reserve(isize capacity)
    {
        impl_assert_not_jailed();
        SV_ASSERT(capacity >= 0, "capacity must be non-negative");

        if (capacity > _capacity)
            impl_reallocate(capacity);
        _occupied.reserve(capacity);
    }

    /// Releases unused capacity beyond next_index().
    /// Empty slots below next_index() are kept; compact first to release those as well.
    void shrink_to_fit()
    {
        impl_assert_not_jailed();

        if (_capacity > next_index())
            impl_reallocate(next_index());
    }

    // compaction
public:
    /// Removes all empty slots, keeping the relative order of the elements.
    /// Afterwards, the elements occupy slots 0 .. num_elements()-1.
    /// Every slot index obtained before is potentially stale afterwards.
    /// Must not be called while jailed.
    void make_compact()
    {
        SV_ASSERT_ALWAYS(!is_jailed(), "cannot compact a stable_vector while a jailed_stable_vector holds it");

        auto const n = next_index();
        auto dst = _occupied.find_next_unset(0);
        auto src = dst;
        while (true)
        {
            src = _occupied.find_next_set(src);
            if (src == n)
                break;

            impl_relocate(src, dst);
            ++dst;
            ++src;
        }

        _occupied.truncate(_num_elements);
        SV_ASSERT(_occupied.count() == _num_elements, "compaction lost track of elements");
    }

    /// Removes all empty slots by moving the elements with the highest slot indices into the holes.
    /// Moves at most one element per hole; the order of the elements is not preserved.
    /// Every slot index obtained before is potentially stale afterwards.
    /// Must not be called while jailed.
    void reordering_make_compact()
    {
        SV_ASSERT_ALWAYS(!is_jailed(), "cannot compact a stable_vector while a jailed_stable_vector holds it");

        auto hole = _occupied.find_next_unset(0);
        auto last = _occupied.find_prev_set(next_index());
        while (hole < last)
        {
            impl_relocate(last, hole);
            hole = _occupied.find_next_unset(hole + 1);
            last = _occupied.find_prev_set(last);
        }

        _occupied.truncate(_num_elements);
        SV_ASSERT(_occupied.count() == _num_elements, "compaction lost track of elements");
    }

    // conversion
public:
    /// Moves all elements, in slot order, into a std::vector and leaves this container empty.
    [[nodiscard]] std::vector<T> into_vector() &&
    {
        impl_assert_not_jailed();

        std::vector<T> result;
        result.reserve(_num_elements);
        for (auto& e : *this)
            result.push_back(sv::move(e));

        clear();
        return result;
    }

    // scopes
public:
    /// Opens a scope over this container.
    /// Returns a guard with exclusive access; indices it hands out cannot be used with any other guard.
    /// Defined in <stable-vec/jailed_stable_vector.hh>.
    template <class ScopeTag = default_scope_tag>
    [[nodiscard]] jailed_stable_vector<T, ScopeTag> jail() &;

    /// A guard must not outlive its container, so temporaries cannot be jailed.
    template <class ScopeTag = default_scope_tag>
    void jail() && = delete;

    /// Opens a scope, calls f(guard) and closes the scope again.
    /// The scope tag is the closure type of f, so indices from different lambdas have different types.
    /// Returns whatever f returns.
    /// Defined in <stable-vec/jailed_stable_vector.hh>.
    template <class F>
    decltype(auto) jail(F&& f) &;

    template <class F>
    void jail(F&& f) && = delete;

    // ctors / assignment
public:
    stable_vector() = default;

    ~stable_vector()
    {
        SV_ASSERT_ALWAYS(!is_jailed(), "stable_vector destroyed while a jailed_stable_vector holds it");
        impl_destroy_all();
        impl::deallocate_bytes(reinterpret_cast<byte*>(_data), _capacity * isize(sizeof(T)), impl::slot_alignment_for<T>());
    }

    /// Deep copy, empty slots included, so every slot index of rhs names the same value in the copy.
    /// The copy is never jailed.
    stable_vector(stable_vector const& rhs)
        requires std::is_copy_constructible_v<T>
    {
        impl_copy_from(rhs);
    }

    stable_vector(stable_vector&& rhs) noexcept
    {
        SV_ASSERT_ALWAYS(!rhs.is_jailed(), "cannot move from a stable_vector while a jailed_stable_vector holds it");

        _data = sv::exchange(rhs._data, nullptr);
        _capacity = sv::exchange(rhs._capacity, 0);
        _num_elements = sv::exchange(rhs._num_elements, 0);
        _occupied = sv::move(rhs._occupied);
        rhs._occupied.clear();
    }

    stable_vector& operator=(stable_vector const& rhs)
        requires std::is_copy_constructible_v<T>
    {
        if (this != &rhs)
        {
            impl_assert_not_jailed();
            impl_destroy_all();
            _occupied.clear();
            _num_elements = 0;
            impl_copy_from(rhs);
        }
        return *this;
    }

    stable_vector& operator=(stable_vector&& rhs) noexcept
    {
        if (this != &rhs)
        {
            SV_ASSERT_ALWAYS(!is_jailed() && !rhs.is_jailed(), "cannot move-assign a jailed stable_vector");

            impl_destroy_all();
            impl::deallocate_bytes(reinterpret_cast<byte*>(_data), _capacity * isize(sizeof(T)), impl::slot_alignment_for<T>());

            _data = sv::exchange(rhs._data, nullptr);
            _capacity = sv::exchange(rhs._capacity, 0);
            _num_elements = sv::exchange(rhs._num_elements, 0);
            _occupied = sv::move(rhs._occupied);
            rhs._occupied.clear();
        }
        return *this;
    }

    // implementation
private:
    [[nodiscard]] T* impl_slot(isize i) { return _data + i; }
    [[nodiscard]] T const* impl_slot(isize i) const { return _data + i; }

    void impl_assert_not_jailed() const
    {
        SV_ASSERT_ALWAYS(!is_jailed(), "stable_vector is held by a jailed_stable_vector, mutate it through the guard");
    }

    template <class... Args>
    isize impl_emplace_back(Args&&... args)
    {
        auto const i = next_index();

        if (i < _capacity)
        {
            new (sv::placement_new, impl_slot(i)) T(sv::forward<Args>(args)...);
        }
        else
        {
            // construct the new element first: args may refer to elements of the old block
            auto const new_capacity = impl::grow_capacity_for(_capacity, i + 1);
            auto* const new_data = impl_allocate(new_capacity);
            try
            {
                new (sv::placement_new, new_data + i) T(sv::forward<Args>(args)...);
            }
            catch (...)
            {
                impl::deallocate_bytes(reinterpret_cast<byte*>(new_data), new_capacity * isize(sizeof(T)),
                                       impl::slot_alignment_for<T>());
                throw;
            }
            impl_move_live_elements_to(new_data, new_capacity, i, i);
        }

        _occupied.push_back(true);
        ++_num_elements;
        return i;
    }

    optional<T> impl_pop_at(isize i)
    {
        SV_ASSERTF(0 <= i && i < next_index(), "slot {} out of bounds (next_index: {})", i, next_index());

        if (!_occupied.test(i))
            return nullopt;

        auto* const p = impl_slot(i);
        optional<T> result(sv::move(*p));
        p->~T();
        _occupied.reset(i);
        --_num_elements;
        return result;
    }

    optional<T> impl_pop_back()
    {
        auto const i = _occupied.find_prev_set(next_index());
        if (i < 0)
            return nullopt;

        return impl_pop_at(i);
    }

    // moves the element at slot src into the empty slot dst
    void impl_relocate(isize src, isize dst)
    {
        SV_ASSERT(_occupied.test(src) && !_occupied.test(dst), "relocation needs an element and a hole");

        new (sv::placement_new, impl_slot(dst)) T(sv::move(*impl_slot(src)));
        impl_slot(src)->~T();
        _occupied.set(dst);
        _occupied.reset(src);
    }

    [[nodiscard]] static T* impl_allocate(isize capacity)
    {
        return reinterpret_cast<T*>(impl::allocate_bytes(capacity * isize(sizeof(T)), impl::slot_alignment_for<T>()));
    }

    void impl_reallocate(isize new_capacity)
    {
        SV_ASSERT(new_capacity >= next_index(), "reallocation would drop slots");

        auto* const new_data = impl_allocate(new_capacity);
        impl_move_live_elements_to(new_data, new_capacity, next_index(), -1);
    }

    // copy when a move could throw halfway, so a failed relocation leaves the old block intact
    static constexpr bool impl_relocates_by_move = std::is_nothrow_move_constructible_v<T> || !std::is_copy_constructible_v<T>;

    // moves all live elements in slots [0, slot_count) to the same slots of new_data and adopts new_data
    // pending_slot is a slot of new_data that already holds an element (or -1)
    // if a relocation throws, new_data is destroyed and freed and the live elements keep their slots
    void impl_move_live_elements_to(T* new_data, isize new_capacity, isize slot_count, isize pending_slot)
    {
        isize i = _occupied.find_next_set(0);
        try
        {
            for (; i < slot_count; i = _occupied.find_next_set(i + 1))
            {
                if constexpr (impl_relocates_by_move)
                    new (sv::placement_new, new_data + i) T(sv::move(*impl_slot(i)));
                else
                    new (sv::placement_new, new_data + i) T(static_cast<T const&>(*impl_slot(i)));
            }
        }
        catch (...)
        {
            for (auto j = _occupied.find_next_set(0); j < i; j = _occupied.find_next_set(j + 1))
                new_data[j].~T();
            if (pending_slot >= 0)
                new_data[pending_slot].~T();
            impl::deallocate_bytes(reinterpret_cast<byte*>(new_data), new_capacity * isize(sizeof(T)),
                                   impl::slot_alignment_for<T>());
            throw;
        }

        impl_destroy_all();
        impl::deallocate_bytes(reinterpret_cast<byte*>(_data), _capacity * isize(sizeof(T)), impl::slot_alignment_for<T>());
        _data = new_data;
        _capacity = new_capacity;
    }

    // destroys all live elements, leaves occupancy untouched
    void impl_destroy_all()
    {
        if constexpr (!std::is_trivially_destructible_v<T>)
        {
            for (auto i = _occupied.find_next_set(0); i < next_index(); i = _occupied.find_next_set(i + 1))
                impl_slot(i)->~T();
        }
    }

    // precondition: *this holds no live elements
    void impl_copy_from(stable_vector const& rhs)
    {
        if (_capacity < rhs.next_index())
        {
            impl::deallocate_bytes(reinterpret_cast<byte*>(_data), _capacity * isize(sizeof(T)), impl::slot_alignment_for<T>());
            _data = nullptr;
            _capacity = 0;
            _data = impl_allocate(rhs.next_index());
            _capacity = rhs.next_index();
        }

        // occupancy is built up while copying so that a throwing copy leaves a consistent container
        _occupied.reserve(rhs.next_index());
        for (isize i = 0; i < rhs.next_index(); ++i)
        {
            if (rhs._occupied.test(i))
            {
                new (sv::placement_new, impl_slot(i)) T(*rhs.impl_slot(i));
                _occupied.push_back(true);
                ++_num_elements;
            }
            else
            {
                _occupied.push_back(false);
            }
        }
    }

    // members
private:
    T* _data = nullptr;
    isize _capacity = 0;
    isize _num_elements = 0;
    occupancy_bits _occupied;

    // id of the jailed_stable_vector currently holding this container
    u64 _scope = impl::no_scope_id;

    template <class, class>
    friend struct jailed_stable_vector;
    template <class, bool>
    friend struct impl::stable_vector_iterator;
};

// =========================================================================================================
// Iteration
// =========================================================================================================

/// Forward iterator over the live elements of a stable_vector.
template <class T, bool IsConst>
struct sv::impl::stable_vector_iterator
{
    using vector_t = std::conditional_t<IsConst, stable_vector<T> const, stable_vector<T>>;

    using iterator_category = std::forward_iterator_tag;
    using value_type = T;
    using difference_type = isize;
    using pointer = std::conditional_t<IsConst, T const*, T*>;
    using reference = std::conditional_t<IsConst, T const&, T&>;

    stable_vector_iterator() = default;
    stable_vector_iterator(vector_t* vec, isize index) : _vec(vec), _index(index) {}

    /// Slot index of the current element.
    [[nodiscard]] isize index() const { return _index; }

    [[nodiscard]] reference operator*() const
    {
        SV_ASSERT(_vec->has_element_at(_index), "dereferencing an invalid stable_vector iterator");
        return *_vec->impl_slot(_index);
    }
    [[nodiscard]] pointer operator->() const { return &**this; }

    stable_vector_iterator& operator++()
    {
        _index = _vec->_occupied.find_next_set(_index + 1);
        return *this;
    }
    stable_vector_iterator operator++(int)
    {
        auto tmp = *this;
        ++*this;
        return tmp;
    }

    [[nodiscard]] bool operator==(stable_vector_iterator const& rhs) const { return _index == rhs._index; }

private:
    vector_t* _vec = nullptr;
    isize _index = 0;
};

/// Forward iterator over the indices of set bits in an occupancy_bits.
struct sv::impl::stable_vector_index_iterator
{
    using iterator_category = std::forward_iterator_tag;
    using value_type = isize;
    using difference_type = isize;
    using pointer = isize const*;
    using reference = isize;

    stable_vector_index_iterator() = default;
    stable_vector_index_iterator(occupancy_bits const* bits, isize index) : _bits(bits), _index(index) {}

    [[nodiscard]] isize operator*() const { return _index; }

    stable_vector_index_iterator& operator++()
    {
        _index = _bits->find_next_set(_index + 1);
        return *this;
    }
    stable_vector_index_iterator operator++(int)
    {
        auto tmp = *this;
        ++*this;
        return tmp;
    }

    [[nodiscard]] bool operator==(stable_vector_index_iterator const& rhs) const { return _index == rhs._index; }

private:
    occupancy_bits const* _bits = nullptr;
    isize _index = 0;
};

struct sv::impl::stable_vector_index_range
{
    [[nodiscard]] stable_vector_index_iterator begin() const { return {_bits, _bits->find_next_set(0)}; }
    [[nodiscard]] stable_vector_index_iterator end() const { return {_bits, _bits->size()}; }

    occupancy_bits const* _bits = nullptr;
};

template <class T>
sv::impl::stable_vector_index_range sv::stable_vector<T>::indices() const
{
    return impl::stable_vector_index_range{&_occupied};
}
