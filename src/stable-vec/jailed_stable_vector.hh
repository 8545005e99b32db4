#pragma once

#include <stable-vec/assertf.hh>
#include <stable-vec/fwd.hh>
#include <stable-vec/optional.hh>
#include <stable-vec/scope_id.hh>
#include <stable-vec/stable_vector.hh>
#include <stable-vec/utility.hh>

#include <type_traits>

struct sv::default_scope_tag
{
};

namespace sv
{
/// Result of classifying a jailed_index against a guard, see jailed_stable_vector::state_of.
enum class index_state
{
    /// minted by this guard, slot holds an element
    valid,
    /// minted by this guard, element was removed since
    removed,
    /// minted by a different guard (possibly one that is already closed)
    foreign_scope,
};
} // namespace sv

/// Opaque slot handle minted by a jailed_stable_vector<T, ScopeTag>.
///
/// Only the guard that minted it can resolve it:
///   - the ScopeTag makes tokens of differently tagged guards distinct types,
///     so passing them to the wrong guard does not compile
///   - the runtime scope id distinguishes guards with the same tag (e.g. two jail() calls with the default tag)
///     and is checked on every use
///
/// Copyable and comparable for equality, but carries no public slot number.
/// A token cannot be created except by insert/emplace of a guard.
template <class ScopeTag>
struct sv::jailed_index
{
    jailed_index(jailed_index const&) = default;
    jailed_index& operator=(jailed_index const&) = default;

    [[nodiscard]] bool operator==(jailed_index const& rhs) const = default;

private:
    jailed_index(isize index, u64 scope) : _index(index), _scope(scope) {}

    isize _index;
    u64 _scope;

    template <class, class>
    friend struct jailed_stable_vector;
};

/// Exclusive scope over a stable_vector<T>.
///
/// While the guard is alive, the stable_vector cannot be mutated except through the guard.
/// In particular it cannot be compacted, so every jailed_index minted by the guard keeps naming its slot.
/// This is enforced at runtime: the container remembers the id of the guard holding it,
/// and all of its mutating members assert that no guard does.
///
/// Tokens do not survive the guard: the next guard gets a fresh scope id and rejects them.
///
/// Usage:
///
///   sv::stable_vector<int> v;
///   v.jail([](auto& jailed) {
///       auto a = jailed.insert(1);
///       auto b = jailed.insert(2);
///       auto sum = jailed[a] + jailed[b]; // 3
///       jailed.remove(a);
///   });
///   v.make_compact(); // fine, no guard holds v anymore
///
/// Lookup of a removed token fails an always-on assertion (or returns nullptr through get).
/// Since a guard never reuses slot numbers, a removed token never resolves to another element.
///
/// Not copyable and not movable: the guard lives exactly as long as the scope it was opened in.
template <class T, class ScopeTag>
struct sv::jailed_stable_vector
{
    using index_t = jailed_index<ScopeTag>;

    // insertion
public:
    /// Appends value to the container and returns the token for its slot.
    index_t insert(T const& value) { return emplace(value); }
    index_t insert(T&& value) { return emplace(sv::move(value)); }

    template <class... Args>
    index_t emplace(Args&&... args)
    {
        return index_t(_vec->impl_emplace_back(sv::forward<Args>(args)...), _scope);
    }

    // removal
public:
    /// Removes the element with the highest slot index and returns it.
    /// Returns nullopt if the container holds no element.
    optional<T> remove_last() { return _vec->impl_pop_back(); }

    /// Removes the element named by idx and returns it.
    /// Returns nullopt if it was already removed.
    /// idx must come from this guard.
    optional<T> remove(index_t const& idx)
    {
        impl_check_scope(idx);
        return _vec->impl_pop_at(idx._index);
    }

    // lookup
public:
    /// Returns the element named by idx.
    /// idx must come from this guard and must not have been removed.
    /// Both are checked even in release builds.
    [[nodiscard]] T& operator[](index_t const& idx)
    {
        impl_check_element(idx);
        return *_vec->impl_slot(idx._index);
    }
    [[nodiscard]] T const& operator[](index_t const& idx) const
    {
        impl_check_element(idx);
        return *_vec->impl_slot(idx._index);
    }

    /// Returns the element named by idx, or nullptr if it was removed.
    /// idx must come from this guard.
    [[nodiscard]] T* get(index_t const& idx)
    {
        impl_check_scope(idx);
        return _vec->get(idx._index);
    }
    [[nodiscard]] T const* get(index_t const& idx) const
    {
        impl_check_scope(idx);
        return _vec->get(idx._index);
    }

    /// Classifies idx without asserting.
    [[nodiscard]] index_state state_of(index_t const& idx) const
    {
        if (idx._scope != _scope)
            return index_state::foreign_scope;

        return _vec->has_element_at(idx._index) ? index_state::valid : index_state::removed;
    }

    /// True if idx can be used for lookup with this guard.
    [[nodiscard]] bool contains_index(index_t const& idx) const { return state_of(idx) == index_state::valid; }

    // queries
public:
    [[nodiscard]] isize num_elements() const { return _vec->num_elements(); }
    [[nodiscard]] bool empty() const { return _vec->empty(); }

    /// True if the container currently has no empty slots.
    [[nodiscard]] bool is_compact() const { return _vec->is_compact(); }

    // ctors
public:
    ~jailed_stable_vector() { _vec->_scope = impl::no_scope_id; }

    jailed_stable_vector(jailed_stable_vector const&) = delete;
    jailed_stable_vector(jailed_stable_vector&&) = delete;
    jailed_stable_vector& operator=(jailed_stable_vector const&) = delete;
    jailed_stable_vector& operator=(jailed_stable_vector&&) = delete;

private:
    explicit jailed_stable_vector(stable_vector<T>& vec) : _vec(&vec), _scope(impl::acquire_scope_id())
    {
        SV_ASSERT_ALWAYS(!vec.is_jailed(), "stable_vector is already held by another jailed_stable_vector");
        vec._scope = _scope;
    }

    void impl_check_scope(index_t const& idx) const
    {
        SV_ASSERTF_ALWAYS(idx._scope == _scope, "jailed_index of scope {} used with the guard of scope {}",
                          idx._scope, _scope);
    }

    void impl_check_element(index_t const& idx) const
    {
        impl_check_scope(idx);
        SV_ASSERTF_ALWAYS(_vec->has_element_at(idx._index), "jailed_index names slot {}, which was removed", idx._index);
    }

    // members
private:
    stable_vector<T>* _vec;
    u64 _scope;

    friend struct stable_vector<T>;
};

// =========================================================================================================
// stable_vector scope entry
// =========================================================================================================

template <class T>
template <class ScopeTag>
sv::jailed_stable_vector<T, ScopeTag> sv::stable_vector<T>::jail() &
{
    return jailed_stable_vector<T, ScopeTag>(*this);
}

template <class T>
template <class F>
decltype(auto) sv::stable_vector<T>::jail(F&& f) &
{
    auto jailed = this->template jail<std::remove_cvref_t<F>>();
    return sv::forward<F>(f)(jailed);
}
